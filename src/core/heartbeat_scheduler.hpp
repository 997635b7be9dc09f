#pragma once

#include "common/config.hpp"
#include "core/outbox.hpp"
#include "core/peer_registry.hpp"

#include <boost/asio.hpp>

#include <atomic>
#include <chrono>
#include <expected>

namespace neolan::core {

namespace asio = boost::asio;

// 周期性 BR_ENTRY 广播。启动时立即发送一次，此后每个 interval 一次。
// 析构前需 stop() 并让 io_context 排空。
class HeartbeatScheduler {
public:
    HeartbeatScheduler(asio::io_context& ioc, Outbox& outbox, PeerRegistry& registry,
                       std::chrono::seconds interval);
    ~HeartbeatScheduler();

    HeartbeatScheduler(const HeartbeatScheduler&) = delete;
    HeartbeatScheduler& operator=(const HeartbeatScheduler&) = delete;

    void start();
    void stop();

    // 新间隔作用于下一次 tick；越界返回 INTERVAL_OUT_OF_RANGE
    std::expected<void, ConfigError> set_interval(std::chrono::seconds interval);

    std::chrono::seconds interval() const { return std::chrono::seconds(interval_.load()); }
    uint64_t heartbeat_count() const { return heartbeat_count_.load(); }
    bool running() const { return running_.load(); }

private:
    asio::awaitable<void> heartbeat_loop();
    void tick();

    Outbox& outbox_;
    PeerRegistry& registry_;

    asio::strand<asio::io_context::executor_type> strand_;
    asio::steady_timer timer_;

    std::atomic<int64_t> interval_;
    std::atomic<uint64_t> heartbeat_count_{0};
    std::atomic<bool> running_{false};
};

} // namespace neolan::core
