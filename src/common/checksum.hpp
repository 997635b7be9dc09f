#pragma once

#include "common/protocol.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>

// Forward declaration for OpenSSL type
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace neolan {

struct EvpMdCtxDeleter { void operator()(EVP_MD_CTX* p) const; };
using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

// 增量 MD5（OpenSSL EVP），用于边收边校验
class Md5 {
public:
    Md5();

    void update(std::span<const uint8_t> data);
    void update(const char* data, size_t size);

    // 结束并返回小写十六进制摘要；之后对象不可再用
    std::string final_hex();

    bool valid() const { return ctx_ != nullptr; }

private:
    EvpMdCtxPtr ctx_;
};

// 计算整个文件的 MD5
std::expected<std::string, ErrorCode> md5_file(const std::string& path);

std::string to_hex(std::span<const uint8_t> bytes);

} // namespace neolan
