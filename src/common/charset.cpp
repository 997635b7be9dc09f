#include "common/charset.hpp"
#include "common/logger.hpp"

#include <boost/locale/encoding.hpp>
#include <boost/locale/encoding_errors.hpp>
#include <boost/locale/encoding_utf.hpp>

namespace neolan {

namespace {
auto& log() { return Logger::get("common.charset"); }

constexpr const char* LEGACY_CHARSET = "GBK";
}  // anonymous namespace

const char* charset_name(Charset charset) {
    switch (charset) {
        case Charset::Utf8:   return "UTF-8";
        case Charset::Legacy: return LEGACY_CHARSET;
    }
    return "UTF-8";
}

namespace charset {

bool is_ascii(std::string_view bytes) {
    for (unsigned char c : bytes) {
        if (c >= 0x80) return false;
    }
    return true;
}

bool is_valid_utf8(std::string_view bytes) {
    try {
        (void)boost::locale::conv::utf_to_utf<char>(
            bytes.data(), bytes.data() + bytes.size(), boost::locale::conv::stop);
        return true;
    } catch (const boost::locale::conv::conversion_error&) {
        return false;
    }
}

std::expected<std::string, ErrorCode> decode(std::string_view bytes, Charset charset) {
    if (is_ascii(bytes)) {
        return std::string(bytes);
    }

    if (charset == Charset::Utf8) {
        if (!is_valid_utf8(bytes)) {
            return std::unexpected(ErrorCode::CHARSET_ERROR);
        }
        return std::string(bytes);
    }

    try {
        return boost::locale::conv::to_utf<char>(
            bytes.data(), bytes.data() + bytes.size(), LEGACY_CHARSET, boost::locale::conv::stop);
    } catch (const boost::locale::conv::conversion_error&) {
        return std::unexpected(ErrorCode::CHARSET_ERROR);
    } catch (const boost::locale::conv::invalid_charset_error& e) {
        log().error("Legacy charset unavailable: {}", e.what());
        return std::unexpected(ErrorCode::CHARSET_ERROR);
    }
}

std::expected<std::string, ErrorCode> encode(std::string_view utf8, Charset charset) {
    if (is_ascii(utf8)) {
        return std::string(utf8);
    }

    if (!is_valid_utf8(utf8)) {
        return std::unexpected(ErrorCode::CHARSET_ERROR);
    }

    if (charset == Charset::Utf8) {
        return std::string(utf8);
    }

    try {
        return boost::locale::conv::from_utf<char>(
            utf8.data(), utf8.data() + utf8.size(), LEGACY_CHARSET, boost::locale::conv::stop);
    } catch (const boost::locale::conv::conversion_error&) {
        return std::unexpected(ErrorCode::CHARSET_ERROR);
    } catch (const boost::locale::conv::invalid_charset_error& e) {
        log().error("Legacy charset unavailable: {}", e.what());
        return std::unexpected(ErrorCode::CHARSET_ERROR);
    }
}

}  // namespace charset

}  // namespace neolan
