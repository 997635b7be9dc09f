#include "common/packet.hpp"
#include "common/logger.hpp"

#include <array>
#include <charconv>

namespace neolan {

namespace {
auto& log() { return Logger::get("common.codec"); }

bool contains_reserved(std::string_view s) {
    return s.find(protocol::DELIMITER) != std::string_view::npos ||
           s.find(protocol::EXTENSION_SEPARATOR) != std::string_view::npos;
}

template<typename T>
bool parse_decimal(std::string_view s, T& out) {
    if (s.empty()) return false;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc() && ptr == s.data() + s.size();
}

// 解析版本字段：纯数字，或飞秋的 "<数字>_<标签>#..." 形式
bool parse_version(std::string_view token, uint32_t& version, std::string& tag) {
    if (parse_decimal(token, version)) {
        tag.clear();
        return true;
    }

    auto underscore = token.find('_');
    if (underscore == std::string_view::npos || underscore == 0) {
        return false;
    }
    if (!parse_decimal(token.substr(0, underscore), version)) {
        return false;
    }
    tag = std::string(token);
    return true;
}

// 附加段：去掉尾部 NUL 和一个 IPMsg 结束符 ':'，再按 ':' / NUL 切分
std::vector<std::string_view> split_extensions(std::string_view section) {
    std::vector<std::string_view> fields;

    while (!section.empty() && section.back() == protocol::EXTENSION_SEPARATOR) {
        section.remove_suffix(1);
    }
    if (section.empty()) {
        return fields;
    }
    if (section.back() == protocol::DELIMITER) {
        section.remove_suffix(1);
    }

    size_t start = 0;
    for (size_t i = 0; i <= section.size(); ++i) {
        if (i == section.size() ||
            section[i] == protocol::DELIMITER ||
            section[i] == protocol::EXTENSION_SEPARATOR) {
            fields.push_back(section.substr(start, i - start));
            start = i + 1;
        }
    }
    return fields;
}

}  // anonymous namespace

std::expected<std::vector<uint8_t>, ErrorCode> PacketCodec::encode(const Packet& packet) {
    if (packet.sender_name.empty() || packet.sender_host.empty()) {
        return std::unexpected(ErrorCode::EMPTY_SENDER);
    }
    if (contains_reserved(packet.sender_name) || contains_reserved(packet.sender_host) ||
        contains_reserved(packet.version_tag)) {
        return std::unexpected(ErrorCode::INVALID_FIELD);
    }
    if (packet.content.find(protocol::EXTENSION_SEPARATOR) != std::string::npos) {
        return std::unexpected(ErrorCode::INVALID_FIELD);
    }
    for (const auto& ext : packet.extensions) {
        if (contains_reserved(ext)) {
            return std::unexpected(ErrorCode::INVALID_FIELD);
        }
    }
    if (packet.content.size() > protocol::MAX_CONTENT_SIZE) {
        return std::unexpected(ErrorCode::MESSAGE_TOO_LARGE);
    }
    if (packet.packet_id > protocol::MAX_PACKET_ID) {
        return std::unexpected(ErrorCode::INVALID_NUMBER);
    }
    if (!packet.version_tag.empty()) {
        // 标签必须能按原样解回同一个 version
        uint32_t tag_version = 0;
        std::string tag;
        if (!parse_version(packet.version_tag, tag_version, tag) || tag.empty() ||
            tag_version != packet.version) {
            return std::unexpected(ErrorCode::INVALID_FIELD);
        }
    }

    auto cs = packet.charset();
    auto name = charset::encode(packet.sender_name, cs);
    auto host = charset::encode(packet.sender_host, cs);
    auto content = charset::encode(packet.content, cs);
    if (!name || !host || !content) {
        return std::unexpected(ErrorCode::CHARSET_ERROR);
    }

    std::string out;
    out.reserve(64 + name->size() + host->size() + content->size());

    out += packet.version_tag.empty() ? std::to_string(packet.version) : packet.version_tag;
    out += protocol::DELIMITER;
    out += std::to_string(packet.packet_id);
    out += protocol::DELIMITER;
    out += *name;
    out += protocol::DELIMITER;
    out += *host;
    out += protocol::DELIMITER;
    out += std::to_string(packet.command);
    out += protocol::DELIMITER;
    out += *content;

    if (!packet.extensions.empty()) {
        out += protocol::EXTENSION_SEPARATOR;
        for (const auto& ext : packet.extensions) {
            auto encoded = charset::encode(ext, cs);
            if (!encoded) {
                return std::unexpected(ErrorCode::CHARSET_ERROR);
            }
            out += *encoded;
            out += protocol::DELIMITER;
        }
    }

    if (out.size() > protocol::MAX_DATAGRAM_SIZE) {
        return std::unexpected(ErrorCode::MESSAGE_TOO_LARGE);
    }

    return std::vector<uint8_t>(out.begin(), out.end());
}

std::expected<std::vector<uint8_t>, ErrorCode> PacketCodec::encode(Packet packet, Charset charset) {
    if (charset == Charset::Utf8) {
        packet.command |= ipmsg::UTF8OPT;
    } else {
        packet.command &= ~ipmsg::UTF8OPT;
    }
    return encode(packet);
}

std::expected<Packet, ErrorCode> PacketCodec::decode(std::span<const uint8_t> data) {
    return decode(std::string_view(reinterpret_cast<const char*>(data.data()), data.size()));
}

std::expected<Packet, ErrorCode> PacketCodec::decode(std::string_view data) {
    // 有界切分：只找前五个分隔符
    std::array<size_t, protocol::HEADER_FIELD_COUNT> delims{};
    size_t found = 0;
    for (size_t i = 0; i < data.size() && found < delims.size(); ++i) {
        if (data[i] == protocol::DELIMITER) {
            delims[found++] = i;
        }
    }
    if (found < delims.size()) {
        return std::unexpected(ErrorCode::MALFORMED_PACKET);
    }

    auto field = [&](size_t index) -> std::string_view {
        size_t begin = index == 0 ? 0 : delims[index - 1] + 1;
        return data.substr(begin, delims[index] - begin);
    };

    Packet packet;

    if (!parse_version(field(0), packet.version, packet.version_tag)) {
        return std::unexpected(ErrorCode::INVALID_NUMBER);
    }
    if (!parse_decimal(field(1), packet.packet_id) || packet.packet_id > protocol::MAX_PACKET_ID) {
        return std::unexpected(ErrorCode::INVALID_NUMBER);
    }
    if (!parse_decimal(field(4), packet.command)) {
        return std::unexpected(ErrorCode::INVALID_NUMBER);
    }

    auto raw_name = field(2);
    auto raw_host = field(3);
    if (raw_name.empty() || raw_host.empty()) {
        return std::unexpected(ErrorCode::EMPTY_SENDER);
    }

    auto rest = data.substr(delims.back() + 1);
    std::string_view raw_body = rest;
    std::string_view raw_ext;
    auto nul = rest.find(protocol::EXTENSION_SEPARATOR);
    if (nul != std::string_view::npos) {
        raw_body = rest.substr(0, nul);
        raw_ext = rest.substr(nul + 1);
    }
    if (raw_body.size() > protocol::MAX_CONTENT_SIZE) {
        return std::unexpected(ErrorCode::MESSAGE_TOO_LARGE);
    }

    // 先取原始字节，再按 UTF8OPT 转码
    auto cs = packet.charset();
    auto name = charset::decode(raw_name, cs);
    auto host = charset::decode(raw_host, cs);
    auto body = charset::decode(raw_body, cs);
    if (!name || !host || !body) {
        log().debug("Charset decoding failed ({})", charset_name(cs));
        return std::unexpected(ErrorCode::CHARSET_ERROR);
    }

    packet.sender_name = std::move(*name);
    packet.sender_host = std::move(*host);
    packet.content = std::move(*body);

    for (auto raw : split_extensions(raw_ext)) {
        auto ext = charset::decode(raw, cs);
        if (!ext) {
            return std::unexpected(ErrorCode::CHARSET_ERROR);
        }
        packet.extensions.push_back(std::move(*ext));
    }

    return packet;
}

}  // namespace neolan
