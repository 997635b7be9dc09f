#include "common/checksum.hpp"
#include "common/constants.hpp"
#include "common/logger.hpp"

#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace neolan {

namespace {
auto& log() { return Logger::get("common.checksum"); }
}  // anonymous namespace

void EvpMdCtxDeleter::operator()(EVP_MD_CTX* p) const {
    EVP_MD_CTX_free(p);
}

Md5::Md5() : ctx_(EVP_MD_CTX_new()) {
    if (ctx_ && EVP_DigestInit_ex(ctx_.get(), EVP_md5(), nullptr) != 1) {
        log().error("EVP_DigestInit_ex(md5) failed");
        ctx_.reset();
    }
}

void Md5::update(std::span<const uint8_t> data) {
    if (ctx_ && !data.empty()) {
        EVP_DigestUpdate(ctx_.get(), data.data(), data.size());
    }
}

void Md5::update(const char* data, size_t size) {
    update(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(data), size));
}

std::string Md5::final_hex() {
    if (!ctx_) {
        return {};
    }

    std::array<uint8_t, EVP_MAX_MD_SIZE> digest{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), digest.data(), &len) != 1) {
        log().error("EVP_DigestFinal_ex failed");
        ctx_.reset();
        return {};
    }
    ctx_.reset();
    return to_hex(std::span<const uint8_t>(digest.data(), len));
}

std::expected<std::string, ErrorCode> md5_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::unexpected(ErrorCode::FILE_NOT_FOUND);
    }

    Md5 md5;
    if (!md5.valid()) {
        return std::unexpected(ErrorCode::FILE_IO);
    }

    std::array<char, network::TRANSFER_CHUNK_SIZE * 16> buffer{};
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto got = file.gcount();
        if (got > 0) {
            md5.update(buffer.data(), static_cast<size_t>(got));
        }
    }
    if (file.bad()) {
        return std::unexpected(ErrorCode::FILE_IO);
    }

    auto hex = md5.final_hex();
    if (hex.empty()) {
        return std::unexpected(ErrorCode::FILE_IO);
    }
    return hex;
}

std::string to_hex(std::span<const uint8_t> bytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (uint8_t byte : bytes) {
        oss << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

} // namespace neolan
