#include "core/port_pool.hpp"

namespace neolan::core {

PortPool::PortPool(uint16_t start, uint16_t end)
    : start_(start)
    , end_(end < start ? start : end)
    , next_(start) {}

std::optional<uint16_t> PortPool::acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t i = 0; i < capacity(); ++i) {
        uint16_t port = next_;
        next_ = (next_ == end_) ? start_ : static_cast<uint16_t>(next_ + 1);
        if (used_.insert(port).second) {
            return port;
        }
    }
    return std::nullopt;
}

void PortPool::release(uint16_t port) {
    std::lock_guard<std::mutex> lock(mutex_);
    used_.erase(port);
}

bool PortPool::in_use(uint16_t port) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return used_.contains(port);
}

size_t PortPool::in_use_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return used_.size();
}

} // namespace neolan::core
