#include "core/heartbeat_scheduler.hpp"
#include "common/logger.hpp"

namespace neolan::core {

namespace {
auto& log() { return Logger::get("core.heartbeat"); }
}  // anonymous namespace

HeartbeatScheduler::HeartbeatScheduler(asio::io_context& ioc, Outbox& outbox,
                                       PeerRegistry& registry, std::chrono::seconds interval)
    : outbox_(outbox)
    , registry_(registry)
    , strand_(asio::make_strand(ioc))
    , timer_(strand_)
    , interval_(interval.count()) {}

HeartbeatScheduler::~HeartbeatScheduler() {
    running_.store(false);
}

void HeartbeatScheduler::start() {
    if (running_.exchange(true)) {
        return;
    }

    log().info("Starting heartbeat (interval: {}s)", interval_.load());

    asio::co_spawn(strand_, heartbeat_loop(), [](std::exception_ptr ep) {
        if (ep) {
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                log().error("Heartbeat loop terminated: {}", e.what());
            }
        }
    });
}

void HeartbeatScheduler::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    asio::post(strand_, [this] { timer_.cancel(); });
    log().info("Heartbeat stopped after {} broadcasts", heartbeat_count_.load());
}

std::expected<void, ConfigError> HeartbeatScheduler::set_interval(std::chrono::seconds interval) {
    if (auto r = validate_heartbeat_interval(interval); !r) {
        return r;
    }

    interval_.store(interval.count());
    log().info("Heartbeat interval set to {}s", interval.count());

    // 唤醒等待中的定时器，按新间隔重新计算到期时间
    if (running_.load()) {
        asio::post(strand_, [this] { timer_.cancel(); });
    }
    return {};
}

void HeartbeatScheduler::tick() {
    auto sent = outbox_.broadcast(outbox_.make_presence(ipmsg::BR_ENTRY));
    if (!sent) {
        log().warn("Presence broadcast failed: {}", error_code_to_string(sent.error()));
    }

    registry_.touch_local(Clock::now());
    heartbeat_count_.fetch_add(1);
}

asio::awaitable<void> HeartbeatScheduler::heartbeat_loop() {
    tick();
    auto last_tick = std::chrono::steady_clock::now();

    while (running_.load()) {
        timer_.expires_at(last_tick + std::chrono::seconds(interval_.load()));

        boost::system::error_code ec;
        co_await timer_.async_wait(asio::redirect_error(asio::use_awaitable, ec));

        if (!running_.load()) {
            break;
        }
        if (ec == asio::error::operation_aborted) {
            continue;
        }

        tick();
        last_tick = std::chrono::steady_clock::now();
    }

    log().debug("Heartbeat loop exited");
}

} // namespace neolan::core
