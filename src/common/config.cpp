#include "common/config.hpp"

#include <boost/asio/ip/host_name.hpp>
#include <boost/asio/ip/address_v4.hpp>
#include <boost/json.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace json = boost::json;

namespace {

std::string jstr(const json::object& obj, std::string_view key, const std::string& def = {}) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_string())
        return std::string(it->value().as_string());
    return def;
}

bool jbool(const json::object& obj, std::string_view key, bool def = false) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_bool())
        return it->value().as_bool();
    return def;
}

int64_t jint(const json::object& obj, std::string_view key, int64_t def = 0) {
    if (auto it = obj.find(key); it != obj.end()) {
        if (it->value().is_int64()) return it->value().as_int64();
        if (it->value().is_uint64()) return static_cast<int64_t>(it->value().as_uint64());
    }
    return def;
}

const json::object* jsection(const json::object& obj, std::string_view key) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_object())
        return &it->value().as_object();
    return nullptr;
}

// 非负数值；越界时抛出，由 parse 统一转为 INVALID_VALUE
struct InvalidValue : std::runtime_error {
    using std::runtime_error::runtime_error;
};

int64_t jnonneg(const json::object& obj, std::string_view key, int64_t def) {
    auto v = jint(obj, key, def);
    if (v < 0) {
        throw InvalidValue(std::string(key));
    }
    return v;
}

uint16_t jport(const json::object& obj, std::string_view key, uint16_t def) {
    auto v = jint(obj, key, def);
    if (v < 0 || v > 65535) {
        throw InvalidValue(std::string(key));
    }
    return static_cast<uint16_t>(v);
}

}  // anonymous namespace

namespace neolan {

namespace {
auto& log() { return Logger::get("common.config"); }
}  // anonymous namespace

std::string config_error_message(ConfigError error) {
    switch (error) {
        case ConfigError::FILE_NOT_FOUND: return "Configuration file not found";
        case ConfigError::PARSE_ERROR: return "Failed to parse configuration file";
        case ConfigError::INVALID_VALUE: return "Invalid configuration value";
        case ConfigError::MISSING_REQUIRED: return "Missing required configuration";
        case ConfigError::INTERVAL_OUT_OF_RANGE: return "Heartbeat interval must be within [10, 600] seconds";
        case ConfigError::TIMEOUT_NOT_ABOVE_HEARTBEAT: return "Peer timeout must exceed the heartbeat interval";
        case ConfigError::INVALID_PORT_RANGE: return "Invalid TCP port range";
        default: return "Unknown configuration error";
    }
}

std::expected<void, ConfigError> validate_heartbeat_interval(std::chrono::seconds interval) {
    if (interval < defaults::MIN_HEARTBEAT_INTERVAL || interval > defaults::MAX_HEARTBEAT_INTERVAL) {
        return std::unexpected(ConfigError::INTERVAL_OUT_OF_RANGE);
    }
    return {};
}

std::expected<void, ConfigError> validate_peer_timeout(std::chrono::seconds timeout,
                                                       std::chrono::seconds heartbeat_interval) {
    if (timeout <= heartbeat_interval) {
        return std::unexpected(ConfigError::TIMEOUT_NOT_ABOVE_HEARTBEAT);
    }
    return {};
}

// ============================================================================
// NodeConfig
// ============================================================================

std::expected<void, ConfigError> NodeConfig::validate() const {
    if (auto r = validate_heartbeat_interval(heartbeat_interval); !r) {
        return r;
    }
    if (auto r = validate_peer_timeout(peer_timeout, heartbeat_interval); !r) {
        return r;
    }
    if (tcp_port_start == 0 || tcp_port_start > tcp_port_end) {
        return std::unexpected(ConfigError::INVALID_PORT_RANGE);
    }
    if (udp_port == 0 || io_threads == 0) {
        return std::unexpected(ConfigError::INVALID_VALUE);
    }
    if (timeout_check_interval.count() <= 0 || cleanup_interval.count() <= 0) {
        return std::unexpected(ConfigError::INVALID_VALUE);
    }
    if (handshake_timeout.count() <= 0) {
        return std::unexpected(ConfigError::INVALID_VALUE);
    }

    boost::system::error_code ec;
    boost::asio::ip::make_address_v4(bind_address, ec);
    if (ec) {
        return std::unexpected(ConfigError::INVALID_VALUE);
    }
    boost::asio::ip::make_address_v4(broadcast_address, ec);
    if (ec) {
        return std::unexpected(ConfigError::INVALID_VALUE);
    }

    if (save_dir.empty()) {
        return std::unexpected(ConfigError::MISSING_REQUIRED);
    }
    return {};
}

void NodeConfig::resolve_identity() {
    if (username.empty()) {
        const char* user = std::getenv("USER");
        username = (user && *user) ? user : "neolan";
    }
    if (hostname.empty()) {
        boost::system::error_code ec;
        hostname = boost::asio::ip::host_name(ec);
        if (ec || hostname.empty()) {
            hostname = "localhost";
        }
    }
}

LogConfig NodeConfig::log_config() const {
    LogConfig cfg;
    cfg.global_level = log_level_from_string(log_level);
    if (!log_file.empty()) {
        cfg.file_enabled = true;
        cfg.file_path = log_file;
    }
    for (const auto& [module, level] : module_log_levels) {
        cfg.module_levels[module] = log_level_from_string(level);
    }
    return cfg;
}

std::expected<NodeConfig, ConfigError> NodeConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(ConfigError::FILE_NOT_FOUND);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

std::expected<NodeConfig, ConfigError> NodeConfig::parse(const std::string& json_content) {
    NodeConfig config;
    try {
        auto jv = json::parse(json_content);
        if (!jv.is_object()) {
            return std::unexpected(ConfigError::PARSE_ERROR);
        }
        auto& root = jv.as_object();

        // identity section
        if (auto* id = jsection(root, "identity")) {
            config.username = jstr(*id, "username", config.username);
            config.hostname = jstr(*id, "hostname", config.hostname);
            config.nickname = jstr(*id, "nickname", config.nickname);
            config.group = jstr(*id, "group", config.group);
        }

        // network section
        if (auto* net = jsection(root, "network")) {
            config.bind_address = jstr(*net, "bind", config.bind_address);
            config.udp_port = jport(*net, "udp_port", config.udp_port);
            config.broadcast_address = jstr(*net, "broadcast", config.broadcast_address);
            config.legacy_broadcast = jbool(*net, "legacy_broadcast", config.legacy_broadcast);
            config.io_threads = static_cast<size_t>(
                jnonneg(*net, "io_threads", static_cast<int64_t>(config.io_threads)));
        }

        // presence section
        if (auto* p = jsection(root, "presence")) {
            config.heartbeat_interval = std::chrono::seconds(
                jnonneg(*p, "heartbeat_interval", config.heartbeat_interval.count()));
            config.peer_timeout = std::chrono::seconds(
                jnonneg(*p, "peer_timeout", config.peer_timeout.count()));
            config.timeout_check_interval = std::chrono::seconds(
                jnonneg(*p, "timeout_check_interval", config.timeout_check_interval.count()));
            config.cleanup_interval = std::chrono::seconds(
                jnonneg(*p, "cleanup_interval", config.cleanup_interval.count()));
            config.offline_retention = std::chrono::seconds(
                jnonneg(*p, "offline_retention", config.offline_retention.count()));
            config.registry_lock_bound = std::chrono::milliseconds(
                jnonneg(*p, "lock_bound_ms", config.registry_lock_bound.count()));
        }

        // transfer section
        if (auto* t = jsection(root, "transfer")) {
            config.tcp_port_start = jport(*t, "tcp_port_start", config.tcp_port_start);
            config.tcp_port_end = jport(*t, "tcp_port_end", config.tcp_port_end);
            config.save_dir = jstr(*t, "save_dir", config.save_dir);
            config.handshake_timeout = std::chrono::seconds(
                jnonneg(*t, "handshake_timeout", config.handshake_timeout.count()));
            config.progress_interval = std::chrono::milliseconds(
                jnonneg(*t, "progress_interval_ms", config.progress_interval.count()));
            config.transfer_retention = std::chrono::seconds(
                jnonneg(*t, "retention", config.transfer_retention.count()));
        }

        // log section
        if (auto* log_sec = jsection(root, "log")) {
            config.log_level = jstr(*log_sec, "level", config.log_level);
            config.log_file = jstr(*log_sec, "file", config.log_file);
            if (auto* modules = jsection(*log_sec, "modules")) {
                for (const auto& [key, value] : *modules) {
                    if (value.is_string()) {
                        config.module_log_levels[std::string(key)] = std::string(value.as_string());
                    }
                }
            }
        }

    } catch (const InvalidValue& e) {
        log().error("Invalid value for '{}'", e.what());
        return std::unexpected(ConfigError::INVALID_VALUE);
    } catch (const boost::system::system_error& e) {
        log().error("JSON parse error: {}", e.what());
        return std::unexpected(ConfigError::PARSE_ERROR);
    } catch (const std::exception& e) {
        log().error("Config parse error: {}", e.what());
        return std::unexpected(ConfigError::PARSE_ERROR);
    }

    if (auto valid = config.validate(); !valid) {
        log().error("Config rejected: {}", config_error_message(valid.error()));
        return std::unexpected(valid.error());
    }
    return config;
}

// ============================================================================
// RuntimeSettings
// ============================================================================

RuntimeSettings::RuntimeSettings(std::chrono::seconds heartbeat_interval,
                                 std::chrono::seconds peer_timeout)
    : heartbeat_interval_(heartbeat_interval)
    , peer_timeout_(peer_timeout) {}

std::expected<void, ConfigError> RuntimeSettings::set_heartbeat_interval(std::chrono::seconds interval) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto r = validate_heartbeat_interval(interval); !r) {
        return r;
    }
    if (auto r = validate_peer_timeout(peer_timeout_, interval); !r) {
        return r;
    }
    heartbeat_interval_ = interval;
    return {};
}

std::expected<void, ConfigError> RuntimeSettings::set_peer_timeout(std::chrono::seconds timeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto r = validate_peer_timeout(timeout, heartbeat_interval_); !r) {
        return r;
    }
    peer_timeout_ = timeout;
    return {};
}

std::chrono::seconds RuntimeSettings::heartbeat_interval() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return heartbeat_interval_;
}

std::chrono::seconds RuntimeSettings::peer_timeout() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peer_timeout_;
}

} // namespace neolan
