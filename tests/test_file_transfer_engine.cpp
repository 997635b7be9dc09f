#include <gtest/gtest.h>
#include "common/checksum.hpp"
#include "core/file_transfer_engine.hpp"

#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <random>
#include <thread>

using namespace neolan;
using namespace neolan::core;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

using tcp = asio::ip::tcp;

constexpr const char* kLoopback = "127.0.0.1";

// 把编码后的数据报直接交给另一端引擎，来源固定为回环地址
class LoopbackSender : public PacketSender {
public:
    std::expected<void, ErrorCode> send_to(const std::string&, uint16_t,
                                           std::span<const uint8_t> data) override {
        auto packet = PacketCodec::decode(data);
        if (!packet) {
            return std::unexpected(packet.error());
        }
        if (target) {
            target->handle_packet(*packet, kLoopback);
        }
        return {};
    }

    std::expected<void, ErrorCode> broadcast(std::span<const uint8_t>) override {
        return {};
    }

    FileTransferEngine* target = nullptr;
};

Peer make_local(const std::string& address, const std::string& user) {
    Peer local;
    local.address = address;
    local.username = user;
    local.hostname = user + "-pc";
    return local;
}

Packet entry_from(const std::string& user) {
    Packet packet;
    packet.packet_id = 1;
    packet.sender_name = user;
    packet.sender_host = user + "-pc";
    packet.command = ipmsg::make_command(ipmsg::BR_ENTRY, ipmsg::UTF8OPT);
    return packet;
}

struct Side {
    Side(asio::io_context& ioc, const std::string& sentinel, const std::string& user,
         TransferConfig config)
        : registry(bus, make_local(sentinel, user))
        , outbox(sender, registry, Identity{user, user + "-pc", user, {}}, 2425, false)
        , engine(ioc, outbox, registry, bus, std::move(config)) {}

    EventBus bus;
    PeerRegistry registry;
    LoopbackSender sender;
    Outbox outbox;
    FileTransferEngine engine;
};

// 收集某一端的事件，供测试线程等待
class EventLog {
public:
    explicit EventLog(EventBus& bus) {
        handles_.push_back(bus.subscribe<events::TransferOffered>([this](const events::TransferOffered& e) {
            std::lock_guard<std::mutex> lock(mutex_);
            offered_.push_back(e.task);
            cv_.notify_all();
        }));
        handles_.push_back(bus.subscribe<events::TransferCompleted>([this](const events::TransferCompleted& e) {
            std::lock_guard<std::mutex> lock(mutex_);
            completed_.push_back(e.task);
            cv_.notify_all();
        }));
        handles_.push_back(bus.subscribe<events::TransferFailed>([this](const events::TransferFailed& e) {
            std::lock_guard<std::mutex> lock(mutex_);
            failed_.push_back(e);
            cv_.notify_all();
        }));
        handles_.push_back(bus.subscribe<events::TransferProgress>([this](const events::TransferProgress&) {
            std::lock_guard<std::mutex> lock(mutex_);
            ++progress_;
        }));
    }

    std::optional<TransferInfo> wait_offered(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return !offered_.empty(); })) {
            return std::nullopt;
        }
        return offered_.front();
    }

    std::optional<TransferInfo> wait_completed(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return !completed_.empty() || !failed_.empty(); })) {
            return std::nullopt;
        }
        if (completed_.empty()) {
            return std::nullopt;
        }
        return completed_.front();
    }

    std::optional<events::TransferFailed> wait_failed(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return !failed_.empty(); })) {
            return std::nullopt;
        }
        return failed_.front();
    }

    size_t progress_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return progress_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<TransferInfo> offered_;
    std::vector<TransferInfo> completed_;
    std::vector<events::TransferFailed> failed_;
    size_t progress_ = 0;
    std::vector<SubscriptionHandle> handles_;
};

template<typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(10ms);
    }
    return pred();
}

std::string read_all(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

}  // anonymous namespace

class FileTransferEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() / ("neolan-transfer-" + generate_uuid());
        fs::create_directories(root_ / "outbox");
        fs::create_directories(root_ / "inbox");
    }

    void TearDown() override {
        if (alice_) alice_->engine.cancel_all();
        if (bob_) bob_->engine.cancel_all();
        if (alice_ || bob_) {
            std::this_thread::sleep_for(50ms);
        }
        guard_.reset();
        ioc_.stop();
        for (auto& t : threads_) {
            t.join();
        }
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    void start(std::chrono::seconds handshake_timeout = 30s) {
        TransferConfig alice_config;
        alice_config.bind_address = kLoopback;
        alice_config.tcp_port_start = 18400;
        alice_config.tcp_port_end = 18409;
        alice_config.save_dir = (root_ / "alice-inbox").string();
        alice_config.handshake_timeout = handshake_timeout;

        TransferConfig bob_config = alice_config;
        bob_config.tcp_port_start = 18410;
        bob_config.tcp_port_end = 18419;
        bob_config.save_dir = (root_ / "inbox").string();

        alice_ = std::make_unique<Side>(ioc_, "10.0.0.1", "alice", alice_config);
        bob_ = std::make_unique<Side>(ioc_, "10.0.0.2", "bob", bob_config);
        alice_->sender.target = &bob_->engine;
        bob_->sender.target = &alice_->engine;

        auto now = Clock::now();
        alice_->registry.on_packet_received(entry_from("bob"), kLoopback, 2425, now);
        bob_->registry.on_packet_received(entry_from("alice"), kLoopback, 2425, now);

        alice_log_ = std::make_unique<EventLog>(alice_->bus);
        bob_log_ = std::make_unique<EventLog>(bob_->bus);

        for (int i = 0; i < 2; ++i) {
            threads_.emplace_back([this] { ioc_.run(); });
        }
    }

    fs::path write_file(const std::string& name, size_t size) {
        auto path = root_ / "outbox" / name;
        std::mt19937 rng(42);
        std::string data(size, '\0');
        for (auto& c : data) {
            c = static_cast<char>(rng() & 0xFF);
        }
        std::ofstream(path, std::ios::binary).write(data.data(), static_cast<std::streamsize>(data.size()));
        return path;
    }

    asio::io_context ioc_;
    std::optional<asio::executor_work_guard<asio::io_context::executor_type>> guard_{
        asio::make_work_guard(ioc_)};
    std::vector<std::thread> threads_;
    fs::path root_;
    std::unique_ptr<Side> alice_;
    std::unique_ptr<Side> bob_;
    std::unique_ptr<EventLog> alice_log_;
    std::unique_ptr<EventLog> bob_log_;
};

TEST(FileOfferTest, ParsesOfferFields) {
    auto offer = FileOffer::parse({"3", "report.pdf", "a00000", "5f5e1000", "1", "port=8123", "md5=abc123"});
    ASSERT_TRUE(offer.has_value());
    EXPECT_EQ(offer->file_id, 3u);
    EXPECT_EQ(offer->file_name, "report.pdf");
    EXPECT_EQ(offer->file_size, 10485760u);
    EXPECT_EQ(offer->mtime, 0x5f5e1000u);
    EXPECT_EQ(offer->attr, ipmsg::FILE_REGULAR);
    EXPECT_EQ(offer->port, 8123);
    EXPECT_EQ(offer->md5, "abc123");

    EXPECT_EQ(offer->to_extensions(),
              (std::vector<std::string>{"3", "report.pdf", "a00000", "5f5e1000", "1", "port=8123", "md5=abc123"}));
}

TEST(FileOfferTest, LegacyOfferWithoutPort) {
    auto offer = FileOffer::parse({"0", "a.txt", "10", "0", "1"});
    ASSERT_TRUE(offer.has_value());
    EXPECT_FALSE(offer->port.has_value());
    EXPECT_FALSE(offer->md5.has_value());

    EXPECT_FALSE(FileOffer::parse({"0", "a.txt", "10"}).has_value());
    EXPECT_FALSE(FileOffer::parse({"x", "a.txt", "10", "0", "1"}).has_value());
    EXPECT_FALSE(FileOffer::parse({"0", "", "10", "0", "1"}).has_value());
}

TEST(FileDataRequestTest, ParsesHexFields) {
    auto req = FileDataRequest::parse("1f:2:0");
    ASSERT_TRUE(req.has_value());
    EXPECT_EQ(req->packet_id, 0x1fu);
    EXPECT_EQ(req->file_id, 2u);
    EXPECT_EQ(req->offset, 0u);

    // 旧客户端附加的字段被忽略
    auto extra = FileDataRequest::parse("1f:2:0:1");
    ASSERT_TRUE(extra.has_value());
    EXPECT_EQ(extra->file_id, 2u);

    EXPECT_FALSE(FileDataRequest::parse("1f:2").has_value());
    EXPECT_FALSE(FileDataRequest::parse("zz:2:0").has_value());

    FileDataRequest out{0xabc, 7, 0};
    EXPECT_EQ(out.to_content(), "abc:7:0");
}

TEST_F(FileTransferEngineTest, TransfersTenMebibytesOverLoopback) {
    start();
    constexpr uint64_t kSize = 10 * 1024 * 1024;
    auto source = write_file("big.bin", kSize);

    auto sent = alice_->engine.request_send(kLoopback, source.string());
    ASSERT_TRUE(sent.has_value());
    EXPECT_EQ(sent->status, TransferStatus::PENDING);
    EXPECT_EQ(sent->file_size, kSize);
    ASSERT_TRUE(sent->tcp_port.has_value());
    EXPECT_TRUE(alice_->engine.port_pool().in_use(*sent->tcp_port));

    auto offered = bob_log_->wait_offered(5s);
    ASSERT_TRUE(offered.has_value());
    EXPECT_EQ(offered->direction, TransferDirection::INCOMING);
    EXPECT_EQ(offered->file_name, "big.bin");
    EXPECT_EQ(offered->file_size, kSize);
    EXPECT_EQ(offered->tcp_port, sent->tcp_port);

    ASSERT_TRUE(bob_->engine.accept(offered->id).has_value());

    auto received = bob_log_->wait_completed(60s);
    auto delivered = alice_log_->wait_completed(60s);
    ASSERT_TRUE(received.has_value());
    ASSERT_TRUE(delivered.has_value());

    EXPECT_EQ(received->transferred_bytes, kSize);
    EXPECT_EQ(delivered->transferred_bytes, kSize);
    EXPECT_EQ(received->status, TransferStatus::COMPLETED);

    auto expected_md5 = md5_file(source.string());
    auto actual_md5 = md5_file(received->file_path);
    ASSERT_TRUE(expected_md5 && actual_md5);
    EXPECT_EQ(*expected_md5, *actual_md5);
    EXPECT_EQ(fs::file_size(received->file_path), kSize);

    EXPECT_GT(bob_log_->progress_count(), 0u);
    EXPECT_TRUE(wait_until([&] { return alice_->engine.port_pool().in_use_count() == 0; }, 2s));
    EXPECT_EQ(alice_->engine.active_count(), 0u);
}

TEST_F(FileTransferEngineTest, DuplicateNameGetsSuffix) {
    start();
    auto source = write_file("notes.txt", 1000);
    {
        std::ofstream existing(root_ / "inbox" / "notes.txt");
        existing << "already here";
    }

    ASSERT_TRUE(alice_->engine.request_send(kLoopback, source.string()).has_value());
    auto offered = bob_log_->wait_offered(5s);
    ASSERT_TRUE(offered.has_value());
    ASSERT_TRUE(bob_->engine.accept(offered->id).has_value());

    auto received = bob_log_->wait_completed(10s);
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(fs::path(received->file_path).filename().string(), "notes (1).txt");
    EXPECT_EQ(read_all(received->file_path), read_all(source));
    EXPECT_EQ(read_all(root_ / "inbox" / "notes.txt"), "already here");
}

TEST_F(FileTransferEngineTest, RejectCancelsSenderAndReleasesPort) {
    start();
    auto source = write_file("unwanted.bin", 2048);

    auto sent = alice_->engine.request_send(kLoopback, source.string());
    ASSERT_TRUE(sent.has_value());
    auto offered = bob_log_->wait_offered(5s);
    ASSERT_TRUE(offered.has_value());

    ASSERT_TRUE(bob_->engine.reject(offered->id).has_value());

    auto failed = alice_log_->wait_failed(5s);
    ASSERT_TRUE(failed.has_value());
    EXPECT_EQ(failed->status, TransferStatus::CANCELLED);
    EXPECT_EQ(failed->reason, "rejected by peer");

    auto info = alice_->engine.get(sent->id);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->status, TransferStatus::CANCELLED);
    EXPECT_TRUE(wait_until([&] { return alice_->engine.port_pool().in_use_count() == 0; }, 2s));

    EXPECT_EQ(bob_->engine.get(offered->id)->status, TransferStatus::CANCELLED);
    EXPECT_FALSE(bob_->engine.accept(offered->id).has_value());
}

TEST_F(FileTransferEngineTest, HandshakeTimeoutFailsSender) {
    start(1s);
    auto source = write_file("ignored.bin", 64);

    auto sent = alice_->engine.request_send(kLoopback, source.string());
    ASSERT_TRUE(sent.has_value());

    auto failed = alice_log_->wait_failed(5s);
    ASSERT_TRUE(failed.has_value());
    EXPECT_EQ(failed->status, TransferStatus::FAILED);
    EXPECT_EQ(failed->reason, "handshake timeout");
    EXPECT_TRUE(wait_until([&] { return alice_->engine.port_pool().in_use_count() == 0; }, 2s));
}

TEST_F(FileTransferEngineTest, CancelIsIdempotent) {
    start();
    auto source = write_file("c.bin", 64);
    auto sent = alice_->engine.request_send(kLoopback, source.string());
    ASSERT_TRUE(sent.has_value());

    // 未开始的发送不能暂停
    auto paused = alice_->engine.pause(sent->id);
    ASSERT_FALSE(paused.has_value());
    EXPECT_EQ(paused.error(), ErrorCode::INVALID_STATE);

    EXPECT_TRUE(alice_->engine.cancel(sent->id).has_value());
    EXPECT_TRUE(alice_->engine.cancel(sent->id).has_value());
    EXPECT_EQ(alice_->engine.get(sent->id)->status, TransferStatus::CANCELLED);
    EXPECT_TRUE(wait_until([&] { return alice_->engine.port_pool().in_use_count() == 0; }, 2s));

    auto missing = alice_->engine.cancel("no-such-task");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error(), ErrorCode::TASK_NOT_FOUND);
}

TEST_F(FileTransferEngineTest, CancellingPendingOfferNotifiesSender) {
    start();
    auto source = write_file("d.bin", 64);
    ASSERT_TRUE(alice_->engine.request_send(kLoopback, source.string()).has_value());
    auto offered = bob_log_->wait_offered(5s);
    ASSERT_TRUE(offered.has_value());

    ASSERT_TRUE(bob_->engine.cancel(offered->id).has_value());
    auto failed = alice_log_->wait_failed(5s);
    ASSERT_TRUE(failed.has_value());
    EXPECT_EQ(failed->reason, "rejected by peer");
}

TEST_F(FileTransferEngineTest, RequestSendValidatesInputs) {
    start();
    auto missing_file = alice_->engine.request_send(kLoopback, (root_ / "nope.bin").string());
    ASSERT_FALSE(missing_file.has_value());
    EXPECT_EQ(missing_file.error(), ErrorCode::FILE_NOT_FOUND);

    auto source = write_file("e.bin", 16);
    auto unknown_peer = alice_->engine.request_send("192.168.77.77", source.string());
    ASSERT_FALSE(unknown_peer.has_value());
    EXPECT_EQ(unknown_peer.error(), ErrorCode::PEER_NOT_FOUND);
    EXPECT_EQ(alice_->engine.port_pool().in_use_count(), 0u);
}

TEST_F(FileTransferEngineTest, DuplicateOfferIsIgnored) {
    start();

    Packet offer;
    offer.packet_id = 77;
    offer.sender_name = "alice";
    offer.sender_host = "alice-pc";
    offer.command = ipmsg::make_command(ipmsg::SENDMSG, ipmsg::FILEATTACHOPT | ipmsg::UTF8OPT);
    offer.extensions = {"1", "x.txt", "10", "0", "1"};

    bob_->engine.handle_packet(offer, kLoopback);
    bob_->engine.handle_packet(offer, kLoopback);

    auto tasks = bob_->engine.list();
    ASSERT_EQ(tasks.size(), 1u);
    // 没有 port= 时使用对端的 UDP 端口
    EXPECT_EQ(tasks[0].tcp_port, 2425);

    // 目录不是普通文件，不生成任务
    offer.packet_id = 78;
    offer.extensions = {"2", "folder", "0", "0", "2"};
    bob_->engine.handle_packet(offer, kLoopback);
    EXPECT_EQ(bob_->engine.list().size(), 1u);
}

TEST_F(FileTransferEngineTest, SenderWaitsForReceiverClose) {
    start();
    constexpr uint64_t kSize = 64 * 1024;
    auto source = write_file("held.bin", kSize);

    // 不经 UDP 报价，由测试直接扮演接收方
    alice_->sender.target = nullptr;
    auto sent = alice_->engine.request_send(kLoopback, source.string());
    ASSERT_TRUE(sent.has_value());

    asio::io_context client_ioc;
    tcp::socket client(client_ioc);
    client.connect(tcp::endpoint(asio::ip::make_address(kLoopback), *sent->tcp_port));

    Packet request;
    request.packet_id = 9;
    request.sender_name = "bob";
    request.sender_host = "bob-pc";
    request.command = ipmsg::make_command(ipmsg::GETFILEDATA, ipmsg::UTF8OPT);
    request.content = FileDataRequest{sent->packet_id, sent->file_id, 0}.to_content();
    auto bytes = PacketCodec::encode(request);
    ASSERT_TRUE(bytes.has_value());
    asio::write(client, asio::buffer(*bytes));

    std::string data(kSize, '\0');
    asio::read(client, asio::buffer(data));
    EXPECT_EQ(data, read_all(source));

    // 数据全部写出但接收方尚未关闭，不能算送达
    std::this_thread::sleep_for(300ms);
    auto info = alice_->engine.get(sent->id);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->status, TransferStatus::ACTIVE);
    EXPECT_EQ(info->transferred_bytes, kSize);

    // 以 RST 断开表示接收失败
    client.set_option(asio::socket_base::linger(true, 0));
    client.close();

    auto failed = alice_log_->wait_failed(5s);
    ASSERT_TRUE(failed.has_value());
    EXPECT_EQ(failed->status, TransferStatus::FAILED);
    EXPECT_FALSE(alice_log_->wait_completed(100ms).has_value());
    EXPECT_TRUE(wait_until([&] { return alice_->engine.port_pool().in_use_count() == 0; }, 2s));
}

TEST_F(FileTransferEngineTest, ChecksumMismatchFailsBothSides) {
    start();
    constexpr uint64_t kSize = 32 * 1024;
    auto source = write_file("tampered.bin", kSize);

    alice_->sender.target = nullptr;
    auto sent = alice_->engine.request_send(kLoopback, source.string());
    ASSERT_TRUE(sent.has_value());

    // 与真实报价相同，只有 md5 不符
    FileOffer offer;
    offer.file_id = sent->file_id;
    offer.file_name = "tampered.bin";
    offer.file_size = kSize;
    offer.port = sent->tcp_port;
    offer.md5 = "00000000000000000000000000000000";

    Packet packet;
    packet.packet_id = sent->packet_id;
    packet.sender_name = "alice";
    packet.sender_host = "alice-pc";
    packet.command = ipmsg::make_command(ipmsg::SENDMSG, ipmsg::FILEATTACHOPT | ipmsg::UTF8OPT);
    packet.extensions = offer.to_extensions();
    bob_->engine.handle_packet(packet, kLoopback);

    auto offered = bob_log_->wait_offered(5s);
    ASSERT_TRUE(offered.has_value());
    ASSERT_TRUE(bob_->engine.accept(offered->id).has_value());

    auto receiver_failed = bob_log_->wait_failed(10s);
    ASSERT_TRUE(receiver_failed.has_value());
    EXPECT_EQ(receiver_failed->reason, "checksum mismatch");
    EXPECT_TRUE(wait_until([&] { return !fs::exists(root_ / "inbox" / "tampered.bin"); }, 2s));

    auto sender_failed = alice_log_->wait_failed(10s);
    ASSERT_TRUE(sender_failed.has_value());
    EXPECT_EQ(sender_failed->status, TransferStatus::FAILED);
    EXPECT_EQ(alice_->engine.get(sent->id)->status, TransferStatus::FAILED);
}

TEST_F(FileTransferEngineTest, FinishedTasksArePrunedAfterRetention) {
    start();
    auto first = write_file("a.bin", 64);
    auto second = write_file("b.bin", 64);

    alice_->sender.target = nullptr;
    auto done = alice_->engine.request_send(kLoopback, first.string());
    auto waiting = alice_->engine.request_send(kLoopback, second.string());
    ASSERT_TRUE(done.has_value());
    ASSERT_TRUE(waiting.has_value());
    ASSERT_TRUE(alice_->engine.cancel(done->id).has_value());

    // 保留期内不清理
    EXPECT_EQ(alice_->engine.prune_finished(Clock::now()), 0u);
    EXPECT_EQ(alice_->engine.list().size(), 2u);

    auto later = Clock::now() + defaults::TRANSFER_RETENTION + 1s;
    EXPECT_EQ(alice_->engine.prune_finished(later), 1u);
    EXPECT_FALSE(alice_->engine.get(done->id).has_value());

    // 未结束的任务不受保留期影响
    auto remaining = alice_->engine.list();
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(remaining[0].id, waiting->id);
    EXPECT_EQ(alice_->engine.prune_finished(later), 0u);
}

class PauseResumeTest : public FileTransferEngineTest,
                        public ::testing::WithParamInterface<bool> {};

// 参数为 true 时由接收方暂停，否则由发送方暂停
TEST_P(PauseResumeTest, PausedTransferStopsAndResumes) {
    bool receiver_pauses = GetParam();
    start();
    constexpr uint64_t kSize = 10 * 1024 * 1024;
    auto source = write_file("paused.bin", kSize);

    auto sent = alice_->engine.request_send(kLoopback, source.string());
    ASSERT_TRUE(sent.has_value());
    auto offered = bob_log_->wait_offered(5s);
    ASSERT_TRUE(offered.has_value());

    Side& pauser = receiver_pauses ? *bob_ : *alice_;
    std::string task_id = receiver_pauses ? offered->id : sent->id;

    // 第一次进度事件时在任务自己的 strand 上暂停，保证发生在传输中途
    std::atomic<bool> paused{false};
    auto handle = pauser.bus.subscribe<events::TransferProgress>(
        [&](const events::TransferProgress& e) {
            if (e.transferred_bytes < e.file_size && !paused.exchange(true)) {
                EXPECT_TRUE(pauser.engine.pause(task_id).has_value());
            }
        });

    ASSERT_TRUE(bob_->engine.accept(offered->id).has_value());
    ASSERT_TRUE(wait_until([&] {
        auto info = pauser.engine.get(task_id);
        return info && info->status == TransferStatus::PAUSED;
    }, 5s));

    auto at_pause = pauser.engine.get(task_id);
    ASSERT_TRUE(at_pause.has_value());
    EXPECT_EQ(at_pause->status, TransferStatus::PAUSED);
    EXPECT_LT(at_pause->transferred_bytes, kSize);

    std::this_thread::sleep_for(300ms);
    auto still = pauser.engine.get(task_id);
    EXPECT_EQ(still->status, TransferStatus::PAUSED);
    EXPECT_EQ(still->transferred_bytes, at_pause->transferred_bytes);
    EXPECT_FALSE(bob_log_->wait_completed(10ms).has_value());

    ASSERT_TRUE(pauser.engine.resume(task_id).has_value());
    auto again = pauser.engine.resume(task_id);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error(), ErrorCode::INVALID_STATE);

    auto received = bob_log_->wait_completed(60s);
    auto delivered = alice_log_->wait_completed(60s);
    ASSERT_TRUE(received.has_value());
    ASSERT_TRUE(delivered.has_value());
    EXPECT_EQ(received->transferred_bytes, kSize);
    EXPECT_EQ(delivered->transferred_bytes, kSize);
    EXPECT_EQ(md5_file(received->file_path), md5_file(source.string()));
}

INSTANTIATE_TEST_SUITE_P(BothSides, PauseResumeTest, ::testing::Values(true, false),
                         [](const ::testing::TestParamInfo<bool>& info) {
                             return info.param ? std::string("Receiver") : std::string("Sender");
                         });
