#pragma once

#include "common/config.hpp"
#include "core/peer_registry.hpp"

#include <boost/asio.hpp>

#include <atomic>
#include <chrono>

namespace neolan::core {

namespace asio = boost::asio;

struct SupervisorConfig {
    std::chrono::seconds check_interval = defaults::TIMEOUT_CHECK_INTERVAL;
    std::chrono::seconds cleanup_interval = defaults::CLEANUP_INTERVAL;
    std::chrono::seconds offline_retention = defaults::OFFLINE_RETENTION;
    std::chrono::milliseconds lock_bound = defaults::REGISTRY_LOCK_BOUND;
};

// 超时检查 + 离线清理两个周期任务，只通过 PeerRegistry 接口交互。
// 对端超时从 RuntimeSettings 读取，运行期修改在下一轮生效。
class PeerSupervisor {
public:
    PeerSupervisor(asio::io_context& ioc, PeerRegistry& registry,
                   const RuntimeSettings& settings, SupervisorConfig config = {});
    ~PeerSupervisor();

    PeerSupervisor(const PeerSupervisor&) = delete;
    PeerSupervisor& operator=(const PeerSupervisor&) = delete;

    void start();
    void stop();

    // 单轮执行；拿不到锁时记录告警并返回 false
    bool run_timeout_check(TimePoint now);
    bool run_cleanup(TimePoint now);

    uint64_t skipped_cycles() const { return skipped_cycles_.load(); }

private:
    asio::awaitable<void> timeout_loop();
    asio::awaitable<void> cleanup_loop();

    PeerRegistry& registry_;
    const RuntimeSettings& settings_;
    SupervisorConfig config_;

    asio::strand<asio::io_context::executor_type> strand_;
    asio::steady_timer timeout_timer_;
    asio::steady_timer cleanup_timer_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> skipped_cycles_{0};
};

} // namespace neolan::core
