#include <gtest/gtest.h>
#include "core/heartbeat_scheduler.hpp"

#include <mutex>
#include <vector>

using namespace neolan;
using namespace neolan::core;
using namespace std::chrono_literals;

namespace {

class BroadcastRecorder : public PacketSender {
public:
    std::expected<void, ErrorCode> send_to(const std::string&, uint16_t,
                                           std::span<const uint8_t>) override {
        return {};
    }

    std::expected<void, ErrorCode> broadcast(std::span<const uint8_t> data) override {
        auto packet = PacketCodec::decode(data);
        std::lock_guard<std::mutex> lock(mutex);
        if (packet) {
            packets.push_back(*packet);
        }
        return fail ? std::expected<void, ErrorCode>(std::unexpected(ErrorCode::SEND_FAILED))
                    : std::expected<void, ErrorCode>();
    }

    std::mutex mutex;
    std::vector<Packet> packets;
    bool fail = false;
};

Peer make_local() {
    Peer local;
    local.address = "10.0.0.1";
    local.username = "me";
    local.hostname = "my-pc";
    return local;
}

}  // anonymous namespace

class HeartbeatSchedulerTest : public ::testing::Test {
protected:
    HeartbeatSchedulerTest()
        : registry_(bus_, make_local())
        , outbox_(sender_, registry_, Identity{"me", "my-pc", "Me", "dev"}, 2425, false)
        , heartbeat_(ioc_, outbox_, registry_, 60s) {}

    // 让心跳协程在析构前退出
    void TearDown() override {
        heartbeat_.stop();
        ioc_.restart();
        ioc_.run_for(100ms);
    }

    asio::io_context ioc_;
    EventBus bus_;
    PeerRegistry registry_;
    BroadcastRecorder sender_;
    Outbox outbox_;
    HeartbeatScheduler heartbeat_;
};

TEST_F(HeartbeatSchedulerTest, BroadcastsPresenceImmediately) {
    auto before = registry_.local().last_seen;

    heartbeat_.start();
    ioc_.run_for(100ms);

    EXPECT_EQ(heartbeat_.heartbeat_count(), 1u);
    {
        std::lock_guard<std::mutex> lock(sender_.mutex);
        ASSERT_EQ(sender_.packets.size(), 1u);
        const auto& packet = sender_.packets[0];
        EXPECT_EQ(packet.mode(), ipmsg::BR_ENTRY);
        EXPECT_FALSE(packet.has_opt(ipmsg::ABSENCEOPT));
        EXPECT_EQ(packet.content, "Me");
        ASSERT_EQ(packet.extensions.size(), 1u);
        EXPECT_EQ(packet.extensions[0], "dev");
    }
    EXPECT_GE(registry_.local().last_seen, before);

    heartbeat_.stop();
    EXPECT_FALSE(heartbeat_.running());
}

TEST_F(HeartbeatSchedulerTest, AbsentFlagIsAnnounced) {
    outbox_.set_absent(true);
    heartbeat_.start();
    ioc_.run_for(100ms);

    std::lock_guard<std::mutex> lock(sender_.mutex);
    ASSERT_FALSE(sender_.packets.empty());
    EXPECT_TRUE(sender_.packets[0].has_opt(ipmsg::ABSENCEOPT));
}

TEST_F(HeartbeatSchedulerTest, SendFailureDoesNotStopScheduler) {
    sender_.fail = true;
    heartbeat_.start();
    ioc_.run_for(100ms);

    EXPECT_EQ(heartbeat_.heartbeat_count(), 1u);
    EXPECT_TRUE(heartbeat_.running());
}

TEST_F(HeartbeatSchedulerTest, IntervalIsValidated) {
    auto low = heartbeat_.set_interval(5s);
    ASSERT_FALSE(low.has_value());
    EXPECT_EQ(low.error(), ConfigError::INTERVAL_OUT_OF_RANGE);

    auto high = heartbeat_.set_interval(601s);
    ASSERT_FALSE(high.has_value());
    EXPECT_EQ(heartbeat_.interval(), 60s);

    EXPECT_TRUE(heartbeat_.set_interval(10s).has_value());
    EXPECT_EQ(heartbeat_.interval(), 10s);
}
