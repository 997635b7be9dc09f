#include "common/event_bus.hpp"
#include "common/logger.hpp"

#include <algorithm>

namespace neolan {

namespace {
auto& log() { return Logger::get("common.events"); }

// 丢弃告警限流：第 1 次以及之后每 100 次记录一条
constexpr uint64_t DROP_WARN_EVERY = 100;
}  // anonymous namespace

const char* event_name(const AnyEvent& event) {
    struct Visitor {
        const char* operator()(const events::PeerOnline&) const { return "PeerOnline"; }
        const char* operator()(const events::PeerOffline&) const { return "PeerOffline"; }
        const char* operator()(const events::PeerStatusChanged&) const { return "PeerStatusChanged"; }
        const char* operator()(const events::PeerRemoved&) const { return "PeerRemoved"; }
        const char* operator()(const events::MessageReceived&) const { return "MessageReceived"; }
        const char* operator()(const events::MessageSent&) const { return "MessageSent"; }
        const char* operator()(const events::MessageAcknowledged&) const { return "MessageAcknowledged"; }
        const char* operator()(const events::TransferOffered&) const { return "TransferOffered"; }
        const char* operator()(const events::TransferProgress&) const { return "TransferProgress"; }
        const char* operator()(const events::TransferCompleted&) const { return "TransferCompleted"; }
        const char* operator()(const events::TransferFailed&) const { return "TransferFailed"; }
    };
    return std::visit(Visitor{}, event);
}

// ============================================================================
// EventStream
// ============================================================================

bool EventStream::push(AnyEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        if (queue_.size() >= capacity_) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        queue_.push_back(std::move(event));
    }
    cv_.notify_one();
    return true;
}

std::optional<AnyEvent> EventStream::try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    auto event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

std::optional<AnyEvent> EventStream::pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
    if (queue_.empty()) {
        return std::nullopt;
    }
    auto event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

void EventStream::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool EventStream::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t EventStream::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

// ============================================================================
// EventBus
// ============================================================================

EventBus::~EventBus() {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    for (auto& weak : streams_) {
        if (auto stream = weak.lock()) {
            stream->close();
        }
    }
}

std::shared_ptr<EventStream> EventBus::subscribe_stream(size_t capacity) {
    auto stream = std::make_shared<EventStream>(capacity);
    std::lock_guard<std::mutex> lock(streams_mutex_);
    streams_.push_back(stream);
    return stream;
}

size_t EventBus::handler_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& [_, handlers] : handlers_) {
        count += handlers.size();
    }
    return count;
}

void EventBus::dispatch(const Event& event) {
    auto type = event.type();

    std::vector<std::function<void(const Event&)>> handlers_copy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(type);
        if (it != handlers_.end()) {
            handlers_copy.reserve(it->second.size());
            for (const auto& [_, handler] : it->second) {
                handlers_copy.push_back(handler);
            }
        }
    }

    for (const auto& handler : handlers_copy) {
        try {
            handler(event);
        } catch (const std::exception& e) {
            log().error("Event handler threw: {}", e.what());
        }
    }
}

void EventBus::push_to_streams(const AnyEvent& event) {
    std::vector<std::shared_ptr<EventStream>> targets;
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        std::erase_if(streams_, [](const auto& weak) { return weak.expired(); });
        targets.reserve(streams_.size());
        for (auto& weak : streams_) {
            if (auto stream = weak.lock()) {
                targets.push_back(std::move(stream));
            }
        }
    }

    for (auto& stream : targets) {
        if (stream->push(event) || stream->closed()) {
            continue;
        }
        auto total = dropped_total_.fetch_add(1, std::memory_order_relaxed) + 1;
        if (total == 1 || total % DROP_WARN_EVERY == 0) {
            log().warn("Event stream full (capacity {}), dropped {} ({} total)",
                       stream->capacity(), event_name(event), total);
        }
    }
}

} // namespace neolan
