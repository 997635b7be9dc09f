#pragma once

#include "common/protocol.hpp"
#include "common/types.hpp"

#include <chrono>
#include <expected>
#include <mutex>
#include <string>

namespace neolan::core {

// 单个传输任务的状态机，线程安全。I/O 由 FileTransferEngine 驱动。
class TransferTask {
public:
    explicit TransferTask(TransferInfo info);

    TransferInfo info() const;
    const std::string& id() const { return id_; }
    TransferStatus status() const;

    // 非法转换返回 INVALID_STATE；进入 FAILED/CANCELLED 时记录原因
    std::expected<void, ErrorCode> transition(TransferStatus to, std::string error = {});

    // 累加已传字节，不超过 file_size；返回当前值
    uint64_t add_progress(uint64_t bytes);

    // 距上次上报超过 interval 时返回 true 并记录本次时间
    bool progress_due(std::chrono::steady_clock::time_point now,
                      std::chrono::milliseconds interval);

    void set_file_path(std::string path);

private:
    const std::string id_;

    mutable std::mutex mutex_;
    TransferInfo info_;
    std::chrono::steady_clock::time_point last_progress_{};
};

} // namespace neolan::core
