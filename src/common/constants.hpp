#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace neolan {

// ============================================================================
// 协议限制
// ============================================================================
namespace protocol {

// IPMsg 协议版本号
inline constexpr uint32_t VERSION = 1;

// 字段分隔符 / 附加段分隔符
inline constexpr char DELIMITER = ':';
inline constexpr char EXTENSION_SEPARATOR = '\0';

// 头部字段数（version, packet_id, sender_name, sender_host, command）
inline constexpr size_t HEADER_FIELD_COUNT = 5;

inline constexpr uint64_t MAX_PACKET_ID = 0xFFFFFFFFull;
inline constexpr size_t MAX_CONTENT_SIZE = 1024 * 1024;  // 1MB
inline constexpr size_t MAX_DATAGRAM_SIZE = 65535;

}  // namespace protocol

// ============================================================================
// 默认超时设置
// ============================================================================
namespace defaults {

// 心跳
inline constexpr auto HEARTBEAT_INTERVAL = std::chrono::seconds(60);
inline constexpr auto MIN_HEARTBEAT_INTERVAL = std::chrono::seconds(10);
inline constexpr auto MAX_HEARTBEAT_INTERVAL = std::chrono::seconds(600);

// 对端超时与清理
inline constexpr auto PEER_TIMEOUT = std::chrono::seconds(180);
inline constexpr auto TIMEOUT_CHECK_INTERVAL = std::chrono::seconds(30);
inline constexpr auto CLEANUP_INTERVAL = std::chrono::seconds(300);
inline constexpr auto OFFLINE_RETENTION = std::chrono::hours(24);

// 周期任务获取注册表锁的上限，超过则跳过本轮
inline constexpr auto REGISTRY_LOCK_BOUND = std::chrono::milliseconds(50);

// 停止时等待后台任务退出的宽限期
inline constexpr auto SHUTDOWN_GRACE = std::chrono::milliseconds(2000);

// 文件传输
inline constexpr auto TRANSFER_HANDSHAKE_TIMEOUT = std::chrono::seconds(300);
inline constexpr auto TRANSFER_PROGRESS_INTERVAL = std::chrono::milliseconds(200);
// 已结束任务在列表中保留的时长
inline constexpr auto TRANSFER_RETENTION = std::chrono::seconds(3600);

}  // namespace defaults

// ============================================================================
// 网络默认值
// ============================================================================
namespace network {

inline constexpr uint16_t DEFAULT_UDP_PORT = 2425;
inline constexpr const char* DEFAULT_BIND_IP = "0.0.0.0";
inline constexpr const char* DEFAULT_BROADCAST_ADDR = "255.255.255.255";

inline constexpr uint16_t DEFAULT_TCP_PORT_START = 8000;
inline constexpr uint16_t DEFAULT_TCP_PORT_END = 9000;

// 文件块大小
inline constexpr size_t TRANSFER_CHUNK_SIZE = 4096;

// 事件流默认容量
inline constexpr size_t EVENT_STREAM_CAPACITY = 1024;

}  // namespace network

}  // namespace neolan
