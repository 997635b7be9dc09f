#pragma once

#include "common/protocol.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace neolan {

// 线上字符集：本应用之间用 UTF-8，旧客户端（飞秋/IPMsg 中文版）用 GBK
enum class Charset : uint8_t {
    Utf8 = 0,
    Legacy = 1,
};

const char* charset_name(Charset charset);

namespace charset {

// 纯 ASCII 时两种编码字节相同，无需转换
bool is_ascii(std::string_view bytes);

bool is_valid_utf8(std::string_view bytes);

// 线上字节 -> UTF-8，失败返回 CHARSET_ERROR
std::expected<std::string, ErrorCode> decode(std::string_view bytes, Charset charset);

// UTF-8 -> 线上字节，无法用目标字符集表示时返回 CHARSET_ERROR
std::expected<std::string, ErrorCode> encode(std::string_view utf8, Charset charset);

}  // namespace charset

}  // namespace neolan
