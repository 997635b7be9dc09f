#include <gtest/gtest.h>
#include "common/config.hpp"

using namespace neolan;
using namespace std::chrono_literals;

TEST(NodeConfigTest, DefaultsAreValid) {
    NodeConfig config;
    EXPECT_TRUE(config.validate().has_value());
    EXPECT_EQ(config.udp_port, 2425);
    EXPECT_EQ(config.heartbeat_interval, 60s);
    EXPECT_EQ(config.peer_timeout, 180s);
    EXPECT_EQ(config.tcp_port_start, 8000);
    EXPECT_EQ(config.tcp_port_end, 9000);
}

TEST(NodeConfigTest, ParseAllSections) {
    auto config = NodeConfig::parse(R"({
        "identity": { "username": "alice", "hostname": "pc-01", "nickname": "Alice", "group": "dev" },
        "network":  { "bind": "0.0.0.0", "udp_port": 2426, "broadcast": "192.168.1.255",
                      "legacy_broadcast": true, "io_threads": 4 },
        "presence": { "heartbeat_interval": 30, "peer_timeout": 90, "timeout_check_interval": 10,
                      "cleanup_interval": 120, "offline_retention": 3600, "lock_bound_ms": 20 },
        "transfer": { "tcp_port_start": 9000, "tcp_port_end": 9010, "save_dir": "/tmp/in",
                      "handshake_timeout": 60, "progress_interval_ms": 100, "retention": 600 },
        "log":      { "level": "debug", "file": "", "modules": { "core.registry": "trace" } }
    })");
    ASSERT_TRUE(config.has_value());

    EXPECT_EQ(config->username, "alice");
    EXPECT_EQ(config->hostname, "pc-01");
    EXPECT_EQ(config->nickname, "Alice");
    EXPECT_EQ(config->group, "dev");
    EXPECT_EQ(config->udp_port, 2426);
    EXPECT_EQ(config->broadcast_address, "192.168.1.255");
    EXPECT_TRUE(config->legacy_broadcast);
    EXPECT_EQ(config->io_threads, 4u);
    EXPECT_EQ(config->heartbeat_interval, 30s);
    EXPECT_EQ(config->peer_timeout, 90s);
    EXPECT_EQ(config->timeout_check_interval, 10s);
    EXPECT_EQ(config->cleanup_interval, 120s);
    EXPECT_EQ(config->offline_retention, 3600s);
    EXPECT_EQ(config->registry_lock_bound, 20ms);
    EXPECT_EQ(config->tcp_port_start, 9000);
    EXPECT_EQ(config->tcp_port_end, 9010);
    EXPECT_EQ(config->save_dir, "/tmp/in");
    EXPECT_EQ(config->handshake_timeout, 60s);
    EXPECT_EQ(config->progress_interval, 100ms);
    EXPECT_EQ(config->transfer_retention, 600s);
    EXPECT_EQ(config->log_level, "debug");
    EXPECT_EQ(config->module_log_levels.at("core.registry"), "trace");

    auto log_cfg = config->log_config();
    EXPECT_EQ(log_cfg.global_level, LogLevel::DEBUG);
    EXPECT_FALSE(log_cfg.file_enabled);
    EXPECT_EQ(log_cfg.module_levels.at("core.registry"), LogLevel::TRACE);
}

TEST(NodeConfigTest, MissingSectionsKeepDefaults) {
    auto config = NodeConfig::parse(R"({ "identity": { "username": "bob" }, "unknown": 1 })");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->username, "bob");
    EXPECT_EQ(config->udp_port, 2425);
    EXPECT_EQ(config->heartbeat_interval, 60s);
    EXPECT_EQ(config->transfer_retention, 3600s);
}

TEST(NodeConfigTest, TimeoutMustExceedHeartbeat) {
    auto config = NodeConfig::parse(R"({ "presence": { "heartbeat_interval": 60, "peer_timeout": 30 } })");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error(), ConfigError::TIMEOUT_NOT_ABOVE_HEARTBEAT);

    config = NodeConfig::parse(R"({ "presence": { "heartbeat_interval": 60, "peer_timeout": 60 } })");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error(), ConfigError::TIMEOUT_NOT_ABOVE_HEARTBEAT);
}

TEST(NodeConfigTest, HeartbeatRange) {
    EXPECT_EQ(NodeConfig::parse(R"({ "presence": { "heartbeat_interval": 5 } })").error(),
              ConfigError::INTERVAL_OUT_OF_RANGE);
    EXPECT_EQ(NodeConfig::parse(R"({ "presence": { "heartbeat_interval": 601, "peer_timeout": 1200 } })").error(),
              ConfigError::INTERVAL_OUT_OF_RANGE);

    EXPECT_TRUE(validate_heartbeat_interval(10s).has_value());
    EXPECT_TRUE(validate_heartbeat_interval(600s).has_value());
}

TEST(NodeConfigTest, InvalidValues) {
    EXPECT_EQ(NodeConfig::parse("not json").error(), ConfigError::PARSE_ERROR);
    EXPECT_EQ(NodeConfig::parse("[1, 2]").error(), ConfigError::PARSE_ERROR);
    EXPECT_EQ(NodeConfig::parse(R"({ "network": { "udp_port": 70000 } })").error(),
              ConfigError::INVALID_VALUE);
    EXPECT_EQ(NodeConfig::parse(R"({ "network": { "bind": "not-an-ip" } })").error(),
              ConfigError::INVALID_VALUE);
    EXPECT_EQ(NodeConfig::parse(R"({ "transfer": { "tcp_port_start": 9000, "tcp_port_end": 8000 } })").error(),
              ConfigError::INVALID_PORT_RANGE);
    EXPECT_EQ(NodeConfig::parse(R"({ "transfer": { "save_dir": "" } })").error(),
              ConfigError::MISSING_REQUIRED);
}

TEST(NodeConfigTest, LoadMissingFile) {
    EXPECT_EQ(NodeConfig::load("/nonexistent/neolan.json").error(), ConfigError::FILE_NOT_FOUND);
}

TEST(NodeConfigTest, ResolveIdentityFillsBlanks) {
    NodeConfig config;
    config.resolve_identity();
    EXPECT_FALSE(config.username.empty());
    EXPECT_FALSE(config.hostname.empty());

    NodeConfig named;
    named.username = "carol";
    named.hostname = "box";
    named.resolve_identity();
    EXPECT_EQ(named.username, "carol");
    EXPECT_EQ(named.hostname, "box");
}

TEST(RuntimeSettingsTest, RejectsWithoutMutating) {
    RuntimeSettings settings(60s, 180s);

    auto r = settings.set_peer_timeout(30s);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), ConfigError::TIMEOUT_NOT_ABOVE_HEARTBEAT);
    EXPECT_EQ(settings.peer_timeout(), 180s);

    r = settings.set_heartbeat_interval(5s);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), ConfigError::INTERVAL_OUT_OF_RANGE);
    EXPECT_EQ(settings.heartbeat_interval(), 60s);

    // 心跳不能追上当前超时
    r = settings.set_heartbeat_interval(200s);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), ConfigError::TIMEOUT_NOT_ABOVE_HEARTBEAT);
    EXPECT_EQ(settings.heartbeat_interval(), 60s);
}

TEST(RuntimeSettingsTest, AcceptsValidChanges) {
    RuntimeSettings settings(60s, 180s);
    EXPECT_TRUE(settings.set_heartbeat_interval(30s).has_value());
    EXPECT_TRUE(settings.set_peer_timeout(45s).has_value());
    EXPECT_EQ(settings.heartbeat_interval(), 30s);
    EXPECT_EQ(settings.peer_timeout(), 45s);
}

TEST(ConfigErrorTest, Messages) {
    EXPECT_FALSE(config_error_message(ConfigError::TIMEOUT_NOT_ABOVE_HEARTBEAT).empty());
    EXPECT_NE(config_error_message(ConfigError::PARSE_ERROR),
              config_error_message(ConfigError::INVALID_VALUE));
}
