#pragma once

#include "common/charset.hpp"
#include "common/constants.hpp"
#include "common/protocol.hpp"

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace neolan {

// ============================================================================
// Packet - IPMsg 线上报文
//
//   version:packet_id:sender_name:sender_host:command:content[\0ext1:ext2:...:]
//
// 只切分前五个分隔符，content 内的 ':' 原样保留。附加字段位于 content 后的
// NUL 之后（IPMsg 文件列表、BR_ENTRY 分组名都放在这里）。
// 解码后所有文本字段均为 UTF-8。
// ============================================================================
struct Packet {
    uint32_t version = protocol::VERSION;
    std::string version_tag;            // 飞秋等旧客户端的原始版本串，如 "1_lbt6_0#128#..."
    uint64_t packet_id = 0;
    std::string sender_name;
    std::string sender_host;
    uint32_t command = 0;
    std::string content;
    std::vector<std::string> extensions;

    uint32_t mode() const { return ipmsg::get_mode(command); }
    bool has_opt(uint32_t flag) const { return ipmsg::has_opt(command, flag); }

    // 按 UTF8OPT 推断本报文的线上字符集
    Charset charset() const {
        return has_opt(ipmsg::UTF8OPT) ? Charset::Utf8 : Charset::Legacy;
    }

    // 带版本标签的报文来自旧客户端
    bool is_legacy_client() const { return !version_tag.empty(); }

    bool operator==(const Packet&) const = default;
};

class PacketCodec {
public:
    // 按 packet.command 中的 UTF8OPT 选择字符集
    static std::expected<std::vector<uint8_t>, ErrorCode> encode(const Packet& packet);

    // 按指定字符集编码，并相应设置/清除 UTF8OPT
    static std::expected<std::vector<uint8_t>, ErrorCode> encode(Packet packet, Charset charset);

    static std::expected<Packet, ErrorCode> decode(std::span<const uint8_t> data);
    static std::expected<Packet, ErrorCode> decode(std::string_view data);
};

}  // namespace neolan
