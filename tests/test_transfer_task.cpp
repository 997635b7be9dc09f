#include <gtest/gtest.h>
#include "core/transfer_task.hpp"

using namespace neolan;
using namespace neolan::core;

namespace {

TransferInfo make_info(uint64_t size) {
    TransferInfo info;
    info.id = generate_uuid();
    info.direction = TransferDirection::OUTGOING;
    info.peer_address = "192.168.1.20";
    info.file_name = "report.pdf";
    info.file_size = size;
    info.status = TransferStatus::PENDING;
    info.created_at = Clock::now();
    info.updated_at = info.created_at;
    return info;
}

}  // anonymous namespace

TEST(TransferStatusTest, TransitionTable) {
    using S = TransferStatus;
    EXPECT_TRUE(is_valid_transition(S::PENDING, S::ACTIVE));
    EXPECT_TRUE(is_valid_transition(S::PENDING, S::CANCELLED));
    EXPECT_TRUE(is_valid_transition(S::PENDING, S::FAILED));
    EXPECT_TRUE(is_valid_transition(S::ACTIVE, S::PAUSED));
    EXPECT_TRUE(is_valid_transition(S::PAUSED, S::ACTIVE));
    EXPECT_TRUE(is_valid_transition(S::ACTIVE, S::COMPLETED));
    EXPECT_TRUE(is_valid_transition(S::PAUSED, S::CANCELLED));

    EXPECT_FALSE(is_valid_transition(S::PENDING, S::PAUSED));
    EXPECT_FALSE(is_valid_transition(S::PENDING, S::COMPLETED));
    EXPECT_FALSE(is_valid_transition(S::PAUSED, S::COMPLETED));
    EXPECT_FALSE(is_valid_transition(S::ACTIVE, S::PENDING));

    for (auto terminal : {S::COMPLETED, S::FAILED, S::CANCELLED}) {
        EXPECT_TRUE(is_terminal(terminal));
        for (auto to : {S::PENDING, S::ACTIVE, S::PAUSED, S::COMPLETED, S::FAILED, S::CANCELLED}) {
            EXPECT_FALSE(is_valid_transition(terminal, to));
        }
    }
}

TEST(TransferTaskTest, LifecycleToCompletion) {
    TransferTask task(make_info(10000));
    EXPECT_EQ(task.status(), TransferStatus::PENDING);

    ASSERT_TRUE(task.transition(TransferStatus::ACTIVE).has_value());
    task.add_progress(4096);
    task.add_progress(4096);
    ASSERT_TRUE(task.transition(TransferStatus::PAUSED).has_value());
    ASSERT_TRUE(task.transition(TransferStatus::ACTIVE).has_value());
    task.add_progress(1808);
    ASSERT_TRUE(task.transition(TransferStatus::COMPLETED).has_value());

    auto info = task.info();
    EXPECT_EQ(info.transferred_bytes, 10000u);
    EXPECT_DOUBLE_EQ(info.progress(), 1.0);
    EXPECT_FALSE(info.error.has_value());
}

TEST(TransferTaskTest, InvalidTransitionRejected) {
    TransferTask task(make_info(1));
    auto r = task.transition(TransferStatus::COMPLETED);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), ErrorCode::INVALID_STATE);
    EXPECT_EQ(task.status(), TransferStatus::PENDING);
}

TEST(TransferTaskTest, FailureRecordsReason) {
    TransferTask task(make_info(100));
    ASSERT_TRUE(task.transition(TransferStatus::ACTIVE).has_value());
    ASSERT_TRUE(task.transition(TransferStatus::FAILED, "connection lost").has_value());

    auto info = task.info();
    EXPECT_EQ(info.status, TransferStatus::FAILED);
    ASSERT_TRUE(info.error.has_value());
    EXPECT_EQ(*info.error, "connection lost");

    EXPECT_FALSE(task.transition(TransferStatus::CANCELLED).has_value());
}

TEST(TransferTaskTest, ProgressIsMonotonicAndClamped) {
    TransferTask task(make_info(5000));
    uint64_t last = 0;
    for (int i = 0; i < 3; ++i) {
        auto now = task.add_progress(2000);
        EXPECT_GE(now, last);
        last = now;
    }
    EXPECT_EQ(last, 5000u);
}

TEST(TransferTaskTest, ProgressThrottle) {
    TransferTask task(make_info(1));
    auto t0 = std::chrono::steady_clock::now();
    auto interval = std::chrono::milliseconds(200);

    EXPECT_TRUE(task.progress_due(t0, interval));
    EXPECT_FALSE(task.progress_due(t0 + std::chrono::milliseconds(100), interval));
    EXPECT_TRUE(task.progress_due(t0 + std::chrono::milliseconds(250), interval));
}

TEST(TransferTaskTest, UuidsAreUnique) {
    auto a = generate_uuid();
    auto b = generate_uuid();
    EXPECT_EQ(a.size(), 36u);
    EXPECT_NE(a, b);
}
