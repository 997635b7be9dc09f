#pragma once

#include "common/constants.hpp"
#include "common/events.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace neolan {

// ============================================================================
// Subscription Handle
// ============================================================================

class SubscriptionHandle {
public:
    SubscriptionHandle() = default;
    SubscriptionHandle(std::function<void()> unsubscribe) : unsubscribe_(std::move(unsubscribe)) {}
    ~SubscriptionHandle() { unsubscribe(); }

    SubscriptionHandle(const SubscriptionHandle&) = delete;
    SubscriptionHandle& operator=(const SubscriptionHandle&) = delete;

    SubscriptionHandle(SubscriptionHandle&& other) noexcept : unsubscribe_(std::move(other.unsubscribe_)) {
        other.unsubscribe_ = nullptr;
    }

    SubscriptionHandle& operator=(SubscriptionHandle&& other) noexcept {
        if (this != &other) {
            unsubscribe();
            unsubscribe_ = std::move(other.unsubscribe_);
            other.unsubscribe_ = nullptr;
        }
        return *this;
    }

    void unsubscribe() {
        if (unsubscribe_) {
            unsubscribe_();
            unsubscribe_ = nullptr;
        }
    }

private:
    std::function<void()> unsubscribe_;
};

// ============================================================================
// Event Stream - 有界队列订阅者
// 满时丢弃新事件并计数，不阻塞发布方。
// ============================================================================

class EventStream {
public:
    explicit EventStream(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    // 发布方调用；返回 false 表示已满或已关闭
    bool push(AnyEvent event);

    std::optional<AnyEvent> try_pop();

    // 阻塞等待，超时或关闭后返回 nullopt
    std::optional<AnyEvent> pop(std::chrono::milliseconds timeout);

    void close();
    bool closed() const;

    size_t size() const;
    size_t capacity() const { return capacity_; }
    uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<AnyEvent> queue_;
    bool closed_ = false;
    std::atomic<uint64_t> dropped_{0};
};

// ============================================================================
// Event Bus
// 同步分发：emit 在调用线程上依次执行处理器。调用方不得持有内部锁。
// ============================================================================

class EventBus {
public:
    using HandlerId = uint64_t;

    EventBus() = default;
    ~EventBus();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    // Subscribe to an event type
    template<typename EventType>
    [[nodiscard]] SubscriptionHandle subscribe(std::function<void(const EventType&)> handler) {
        auto type = std::type_index(typeid(EventType));
        HandlerId id = next_id_++;

        auto wrapper = [handler = std::move(handler)](const Event& e) {
            handler(static_cast<const EventType&>(e));
        };

        {
            std::lock_guard<std::mutex> lock(mutex_);
            handlers_[type][id] = std::move(wrapper);
        }

        return SubscriptionHandle([this, type, id] {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = handlers_.find(type);
            if (it != handlers_.end()) {
                it->second.erase(id);
            }
        });
    }

    // 所有事件类型进入同一个有界队列
    std::shared_ptr<EventStream> subscribe_stream(size_t capacity = network::EVENT_STREAM_CAPACITY);

    template<typename EventType>
    void emit(const EventType& event) {
        dispatch(event);
        push_to_streams(AnyEvent(event));
    }

    // 所有 stream 累计丢弃数
    uint64_t dropped_events() const { return dropped_total_.load(std::memory_order_relaxed); }

    size_t handler_count() const;

private:
    void dispatch(const Event& event);
    void push_to_streams(const AnyEvent& event);

    mutable std::mutex mutex_;
    std::unordered_map<std::type_index, std::unordered_map<HandlerId, std::function<void(const Event&)>>> handlers_;
    std::atomic<HandlerId> next_id_{0};

    std::mutex streams_mutex_;
    std::vector<std::weak_ptr<EventStream>> streams_;
    std::atomic<uint64_t> dropped_total_{0};
};

} // namespace neolan
