#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace neolan {

// ============================================================================
// IPMsg 命令字
// command 低 8 位为 mode，高 24 位为 option 标志。
// 数值与原始 ipmsg.h 一致，用于与旧客户端（IPMsg / 飞秋）互通。
// ============================================================================
namespace ipmsg {

// mode
inline constexpr uint32_t NOOPERATION     = 0x00000000;
inline constexpr uint32_t BR_ENTRY        = 0x00000001;
inline constexpr uint32_t BR_EXIT         = 0x00000002;
inline constexpr uint32_t ANSENTRY        = 0x00000003;
inline constexpr uint32_t BR_ABSENCE      = 0x00000004;

inline constexpr uint32_t BR_ISGETLIST    = 0x00000010;
inline constexpr uint32_t OKGETLIST       = 0x00000011;
inline constexpr uint32_t GETLIST         = 0x00000012;
inline constexpr uint32_t ANSLIST         = 0x00000013;
inline constexpr uint32_t BR_ISGETLIST2   = 0x00000018;

inline constexpr uint32_t SENDMSG         = 0x00000020;
inline constexpr uint32_t RECVMSG         = 0x00000021;
inline constexpr uint32_t READMSG         = 0x00000030;
inline constexpr uint32_t DELMSG          = 0x00000031;
inline constexpr uint32_t ANSREADMSG      = 0x00000032;

inline constexpr uint32_t GETINFO         = 0x00000040;
inline constexpr uint32_t SENDINFO        = 0x00000041;

inline constexpr uint32_t GETABSENCEINFO  = 0x00000050;
inline constexpr uint32_t SENDABSENCEINFO = 0x00000051;

inline constexpr uint32_t GETFILEDATA     = 0x00000060;
inline constexpr uint32_t RELEASEFILES    = 0x00000061;
inline constexpr uint32_t GETDIRFILES     = 0x00000062;

inline constexpr uint32_t GETPUBKEY       = 0x00000072;
inline constexpr uint32_t ANSPUBKEY       = 0x00000073;

// 全局 option
inline constexpr uint32_t ABSENCEOPT      = 0x00000100;
inline constexpr uint32_t SERVEROPT       = 0x00000200;
inline constexpr uint32_t DIALUPOPT       = 0x00010000;
inline constexpr uint32_t FILEATTACHOPT   = 0x00200000;
inline constexpr uint32_t ENCRYPTOPT      = 0x00400000;
inline constexpr uint32_t UTF8OPT         = 0x00800000;

// 发送上下文 option（与全局 option 数值重叠，需先按 mode 区分）
inline constexpr uint32_t SENDCHECKOPT    = 0x00000100;
inline constexpr uint32_t SECRETOPT       = 0x00000200;
inline constexpr uint32_t BROADCASTOPT    = 0x00000400;
inline constexpr uint32_t MULTICASTOPT    = 0x00000800;
inline constexpr uint32_t NOPOPUPOPT      = 0x00001000;
inline constexpr uint32_t AUTORETOPT      = 0x00002000;
inline constexpr uint32_t RETRYOPT        = 0x00004000;
inline constexpr uint32_t PASSWORDOPT     = 0x00008000;
inline constexpr uint32_t NOLOGOPT        = 0x00020000;

// 文件属性（file-list 条目的 attr 字段）
inline constexpr uint32_t FILE_REGULAR    = 0x00000001;
inline constexpr uint32_t FILE_DIR        = 0x00000002;

inline constexpr uint32_t MODE_MASK = 0x000000FF;
inline constexpr uint32_t OPT_MASK  = 0xFFFFFF00;

constexpr uint32_t get_mode(uint32_t command) { return command & MODE_MASK; }
constexpr uint32_t get_opt(uint32_t command) { return command & OPT_MASK; }
constexpr bool has_opt(uint32_t command, uint32_t flag) { return (get_opt(command) & flag) != 0; }
constexpr uint32_t make_command(uint32_t mode, uint32_t opts) {
    return (mode & MODE_MASK) | (opts & OPT_MASK);
}

// presence 类命令：携带昵称/分组/缺席标志
constexpr bool is_presence(uint32_t command) {
    auto mode = get_mode(command);
    return mode == BR_ENTRY || mode == ANSENTRY || mode == BR_ABSENCE;
}

// mode 名称（未知返回 "UNKNOWN"）
std::string_view command_name(uint32_t command);

// 调试用：名称 + 十六进制 + 标志列表
std::string describe_command(uint32_t command);

}  // namespace ipmsg

// ============================================================================
// Error Codes
// ============================================================================
enum class ErrorCode : uint16_t {
    SUCCESS               = 0,
    INVALID_ARGUMENT      = 1,

    // Protocol errors (1xxx) - 丢弃并记录
    MALFORMED_PACKET      = 1001,
    INVALID_NUMBER        = 1002,
    CHARSET_ERROR         = 1003,
    INVALID_FIELD         = 1004,
    MESSAGE_TOO_LARGE     = 1005,
    EMPTY_SENDER          = 1006,

    // Network errors (2xxx) - 记录，下一个调度点重试
    BIND_FAILED           = 2001,
    SEND_FAILED           = 2002,
    RECEIVE_FAILED        = 2003,
    CONNECT_FAILED        = 2004,
    NOT_RUNNING           = 2005,

    // Transfer errors (3xxx) - 只终止相关任务
    TASK_NOT_FOUND        = 3001,
    INVALID_STATE         = 3002,
    FILE_NOT_FOUND        = 3003,
    FILE_IO               = 3004,
    NO_PORT_AVAILABLE     = 3005,
    PEER_NOT_FOUND        = 3006,
    PEER_REJECTED         = 3007,
    HANDSHAKE_TIMEOUT     = 3008,
    CHECKSUM_MISMATCH     = 3009,
    UNEXPECTED_EOF        = 3010,
};

constexpr std::string_view error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS:            return "Success";
        case ErrorCode::INVALID_ARGUMENT:   return "Invalid argument";
        case ErrorCode::MALFORMED_PACKET:   return "Malformed packet";
        case ErrorCode::INVALID_NUMBER:     return "Invalid numeric field";
        case ErrorCode::CHARSET_ERROR:      return "Charset decoding failed";
        case ErrorCode::INVALID_FIELD:      return "Field contains reserved characters";
        case ErrorCode::MESSAGE_TOO_LARGE:  return "Message too large";
        case ErrorCode::EMPTY_SENDER:       return "Sender name or host is empty";
        case ErrorCode::BIND_FAILED:        return "Socket bind failed";
        case ErrorCode::SEND_FAILED:        return "Send failed";
        case ErrorCode::RECEIVE_FAILED:     return "Receive failed";
        case ErrorCode::CONNECT_FAILED:     return "Connect failed";
        case ErrorCode::NOT_RUNNING:        return "Node not running";
        case ErrorCode::TASK_NOT_FOUND:     return "Transfer task not found";
        case ErrorCode::INVALID_STATE:      return "Invalid transfer state";
        case ErrorCode::FILE_NOT_FOUND:     return "File not found";
        case ErrorCode::FILE_IO:            return "File I/O error";
        case ErrorCode::NO_PORT_AVAILABLE:  return "No TCP port available";
        case ErrorCode::PEER_NOT_FOUND:     return "Peer not found";
        case ErrorCode::PEER_REJECTED:      return "Rejected by peer";
        case ErrorCode::HANDSHAKE_TIMEOUT:  return "Handshake timeout";
        case ErrorCode::CHECKSUM_MISMATCH:  return "Checksum mismatch";
        case ErrorCode::UNEXPECTED_EOF:     return "Unexpected disconnect";
        default:                            return "Unknown error";
    }
}

}  // namespace neolan
