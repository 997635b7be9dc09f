#include "core/peer_supervisor.hpp"
#include "common/logger.hpp"

namespace neolan::core {

namespace {
auto& log() { return Logger::get("core.supervisor"); }

void log_loop_exit(std::exception_ptr ep) {
    if (ep) {
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            log().error("Supervisor loop terminated: {}", e.what());
        }
    }
}
}  // anonymous namespace

PeerSupervisor::PeerSupervisor(asio::io_context& ioc, PeerRegistry& registry,
                               const RuntimeSettings& settings, SupervisorConfig config)
    : registry_(registry)
    , settings_(settings)
    , config_(config)
    , strand_(asio::make_strand(ioc))
    , timeout_timer_(strand_)
    , cleanup_timer_(strand_) {}

PeerSupervisor::~PeerSupervisor() {
    running_.store(false);
}

void PeerSupervisor::start() {
    if (running_.exchange(true)) {
        return;
    }

    log().info("Starting supervisor (check: {}s, cleanup: {}s, retention: {}s)",
               config_.check_interval.count(), config_.cleanup_interval.count(),
               config_.offline_retention.count());

    asio::co_spawn(strand_, timeout_loop(), log_loop_exit);
    asio::co_spawn(strand_, cleanup_loop(), log_loop_exit);
}

void PeerSupervisor::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    asio::post(strand_, [this] {
        timeout_timer_.cancel();
        cleanup_timer_.cancel();
    });
    log().info("Supervisor stopped");
}

bool PeerSupervisor::run_timeout_check(TimePoint now) {
    auto expired = registry_.expire_stale(settings_.peer_timeout(), now, config_.lock_bound);
    if (!expired) {
        skipped_cycles_.fetch_add(1);
        log().warn("Registry busy for {}ms, skipping timeout check", config_.lock_bound.count());
        return false;
    }
    if (*expired > 0) {
        log().debug("Timeout check: {} peer(s) went offline", *expired);
    }
    return true;
}

bool PeerSupervisor::run_cleanup(TimePoint now) {
    auto removed = registry_.evict_offline(config_.offline_retention, now, config_.lock_bound);
    if (!removed) {
        skipped_cycles_.fetch_add(1);
        log().warn("Registry busy for {}ms, skipping cleanup", config_.lock_bound.count());
        return false;
    }
    if (*removed > 0) {
        log().info("Cleanup: evicted {} offline peer(s)", *removed);
    }
    return true;
}

asio::awaitable<void> PeerSupervisor::timeout_loop() {
    while (running_.load()) {
        timeout_timer_.expires_after(config_.check_interval);

        boost::system::error_code ec;
        co_await timeout_timer_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        if (ec || !running_.load()) {
            break;
        }

        run_timeout_check(Clock::now());
    }
    log().debug("Timeout loop exited");
}

asio::awaitable<void> PeerSupervisor::cleanup_loop() {
    while (running_.load()) {
        cleanup_timer_.expires_after(config_.cleanup_interval);

        boost::system::error_code ec;
        co_await cleanup_timer_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        if (ec || !running_.load()) {
            break;
        }

        run_cleanup(Clock::now());
    }
    log().debug("Cleanup loop exited");
}

} // namespace neolan::core
