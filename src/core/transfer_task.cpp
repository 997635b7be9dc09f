#include "core/transfer_task.hpp"
#include "common/logger.hpp"

#include <algorithm>

namespace neolan::core {

namespace {
auto& log() { return Logger::get("core.transfer"); }
}  // anonymous namespace

TransferTask::TransferTask(TransferInfo info)
    : id_(info.id)
    , info_(std::move(info)) {}

TransferInfo TransferTask::info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return info_;
}

TransferStatus TransferTask::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return info_.status;
}

std::expected<void, ErrorCode> TransferTask::transition(TransferStatus to, std::string error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_valid_transition(info_.status, to)) {
        return std::unexpected(ErrorCode::INVALID_STATE);
    }

    log().debug("Task {}: {} -> {}", id_, transfer_status_name(info_.status),
                transfer_status_name(to));

    info_.status = to;
    info_.updated_at = Clock::now();
    if (!error.empty()) {
        info_.error = std::move(error);
    }
    return {};
}

uint64_t TransferTask::add_progress(uint64_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    info_.transferred_bytes = std::min(info_.file_size, info_.transferred_bytes + bytes);
    info_.updated_at = Clock::now();
    return info_.transferred_bytes;
}

bool TransferTask::progress_due(std::chrono::steady_clock::time_point now,
                                std::chrono::milliseconds interval) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (now - last_progress_ < interval) {
        return false;
    }
    last_progress_ = now;
    return true;
}

void TransferTask::set_file_path(std::string path) {
    std::lock_guard<std::mutex> lock(mutex_);
    info_.file_path = std::move(path);
}

} // namespace neolan::core
