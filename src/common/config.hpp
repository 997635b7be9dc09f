#pragma once

#include "common/constants.hpp"
#include "common/logger.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <mutex>
#include <string>
#include <unordered_map>

namespace neolan {

// ============================================================================
// Configuration Error
// ============================================================================

enum class ConfigError {
    FILE_NOT_FOUND,
    PARSE_ERROR,
    INVALID_VALUE,
    MISSING_REQUIRED,
    INTERVAL_OUT_OF_RANGE,
    TIMEOUT_NOT_ABOVE_HEARTBEAT,
    INVALID_PORT_RANGE,
};

std::string config_error_message(ConfigError error);

// ============================================================================
// Node Configuration (JSON)
//
// {
//   "identity": { "username": "alice", "hostname": "pc-01", "nickname": "", "group": "" },
//   "network":  { "bind": "0.0.0.0", "udp_port": 2425, "broadcast": "255.255.255.255",
//                 "legacy_broadcast": false, "io_threads": 2 },
//   "presence": { "heartbeat_interval": 60, "peer_timeout": 180, "timeout_check_interval": 30,
//                 "cleanup_interval": 300, "offline_retention": 86400, "lock_bound_ms": 50 },
//   "transfer": { "tcp_port_start": 8000, "tcp_port_end": 9000, "save_dir": ".",
//                 "handshake_timeout": 300, "progress_interval_ms": 200, "retention": 3600 },
//   "log":      { "level": "info", "file": "", "modules": { "core.registry": "debug" } }
// }
// ============================================================================

struct NodeConfig {
    // identity
    std::string username;                   // 空 = 取 $USER
    std::string hostname;                   // 空 = 本机主机名
    std::string nickname;
    std::string group;

    // network
    std::string bind_address = network::DEFAULT_BIND_IP;
    uint16_t udp_port = network::DEFAULT_UDP_PORT;
    std::string broadcast_address = network::DEFAULT_BROADCAST_ADDR;
    bool legacy_broadcast = false;          // 广播使用 GBK（兼容旧客户端）
    size_t io_threads = 2;

    // presence
    std::chrono::seconds heartbeat_interval = defaults::HEARTBEAT_INTERVAL;
    std::chrono::seconds peer_timeout = defaults::PEER_TIMEOUT;
    std::chrono::seconds timeout_check_interval = defaults::TIMEOUT_CHECK_INTERVAL;
    std::chrono::seconds cleanup_interval = defaults::CLEANUP_INTERVAL;
    std::chrono::seconds offline_retention = defaults::OFFLINE_RETENTION;
    std::chrono::milliseconds registry_lock_bound = defaults::REGISTRY_LOCK_BOUND;

    // transfer
    uint16_t tcp_port_start = network::DEFAULT_TCP_PORT_START;
    uint16_t tcp_port_end = network::DEFAULT_TCP_PORT_END;
    std::string save_dir = ".";
    std::chrono::seconds handshake_timeout = defaults::TRANSFER_HANDSHAKE_TIMEOUT;
    std::chrono::milliseconds progress_interval = defaults::TRANSFER_PROGRESS_INTERVAL;
    std::chrono::seconds transfer_retention = defaults::TRANSFER_RETENTION;

    // log
    std::string log_level = "info";
    std::string log_file;
    std::unordered_map<std::string, std::string> module_log_levels;

    // 校验取值范围与相互约束
    std::expected<void, ConfigError> validate() const;

    // 填充空的 username / hostname
    void resolve_identity();

    LogConfig log_config() const;

    // Load from JSON file
    static std::expected<NodeConfig, ConfigError> load(const std::string& path);

    // Load from JSON string (for testing)
    static std::expected<NodeConfig, ConfigError> parse(const std::string& json_content);
};

std::expected<void, ConfigError> validate_heartbeat_interval(std::chrono::seconds interval);
std::expected<void, ConfigError> validate_peer_timeout(std::chrono::seconds timeout,
                                                       std::chrono::seconds heartbeat_interval);

// ============================================================================
// Runtime Settings
// 运行期可调整的心跳间隔 / 对端超时。校验失败时保持原值。
// ============================================================================

class RuntimeSettings {
public:
    RuntimeSettings(std::chrono::seconds heartbeat_interval, std::chrono::seconds peer_timeout);

    std::expected<void, ConfigError> set_heartbeat_interval(std::chrono::seconds interval);
    std::expected<void, ConfigError> set_peer_timeout(std::chrono::seconds timeout);

    std::chrono::seconds heartbeat_interval() const;
    std::chrono::seconds peer_timeout() const;

private:
    mutable std::mutex mutex_;
    std::chrono::seconds heartbeat_interval_;
    std::chrono::seconds peer_timeout_;
};

} // namespace neolan
