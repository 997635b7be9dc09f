#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <set>

namespace neolan::core {

// 文件传输 TCP 端口池 [start, end]，轮转分配
class PortPool {
public:
    PortPool(uint16_t start, uint16_t end);

    std::optional<uint16_t> acquire();
    void release(uint16_t port);

    bool in_use(uint16_t port) const;
    size_t in_use_count() const;
    size_t capacity() const { return static_cast<size_t>(end_ - start_) + 1; }

private:
    const uint16_t start_;
    const uint16_t end_;

    mutable std::mutex mutex_;
    std::set<uint16_t> used_;
    uint16_t next_;
};

} // namespace neolan::core
