#pragma once

#include "common/event_bus.hpp"
#include "common/packet.hpp"
#include "common/types.hpp"
#include "core/outbox.hpp"
#include "core/peer_registry.hpp"
#include "core/port_pool.hpp"
#include "core/transfer_task.hpp"

#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>

#include <atomic>
#include <chrono>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace neolan::core {

namespace asio = boost::asio;

struct TransferConfig {
    std::string bind_address = network::DEFAULT_BIND_IP;
    uint16_t tcp_port_start = network::DEFAULT_TCP_PORT_START;
    uint16_t tcp_port_end = network::DEFAULT_TCP_PORT_END;
    std::string save_dir = ".";
    std::chrono::seconds handshake_timeout = defaults::TRANSFER_HANDSHAKE_TIMEOUT;
    std::chrono::milliseconds progress_interval = defaults::TRANSFER_PROGRESS_INTERVAL;
    std::chrono::seconds retention = defaults::TRANSFER_RETENTION;
};

// 文件报价（SENDMSG|FILEATTACHOPT 的附加字段）
//   file_id : file_name : size(hex) : mtime(hex) : attr(hex) : port=<n> : md5=<hex>
struct FileOffer {
    uint64_t file_id = 0;
    std::string file_name;
    uint64_t file_size = 0;
    uint64_t mtime = 0;
    uint32_t attr = ipmsg::FILE_REGULAR;
    std::optional<uint16_t> port;
    std::optional<std::string> md5;

    std::vector<std::string> to_extensions() const;
    static std::optional<FileOffer> parse(const std::vector<std::string>& extensions);
};

// GETFILEDATA 请求内容：packet_id(hex):file_id(hex):offset(hex)
struct FileDataRequest {
    uint64_t packet_id = 0;
    uint64_t file_id = 0;
    uint64_t offset = 0;

    std::string to_content() const;
    static std::optional<FileDataRequest> parse(std::string_view content);
};

// 文件传输引擎
//
// 发送方：分配端口并监听 -> UDP 报价 -> 等待接收方连接并发送 GETFILEDATA -> 推流
// 接收方：收到报价生成 Incoming/Pending 任务 -> accept() 连接并请求 -> 收流并校验 MD5
//
// 每个任务在自己的 strand 上以协程运行，cancel/pause/resume 投递到该 strand。
class FileTransferEngine {
public:
    FileTransferEngine(asio::io_context& ioc, Outbox& outbox, const PeerRegistry& registry,
                       EventBus& bus, TransferConfig config);
    ~FileTransferEngine();

    FileTransferEngine(const FileTransferEngine&) = delete;
    FileTransferEngine& operator=(const FileTransferEngine&) = delete;

    std::expected<TransferInfo, ErrorCode> request_send(const std::string& peer_address,
                                                        const std::string& file_path);

    std::expected<void, ErrorCode> accept(const std::string& task_id);
    std::expected<void, ErrorCode> reject(const std::string& task_id);
    std::expected<void, ErrorCode> cancel(const std::string& task_id);
    std::expected<void, ErrorCode> pause(const std::string& task_id);
    std::expected<void, ErrorCode> resume(const std::string& task_id);

    std::optional<TransferInfo> get(const std::string& task_id) const;
    std::vector<TransferInfo> list() const;

    // SENDMSG|FILEATTACHOPT 与 RELEASEFILES
    void handle_packet(const Packet& packet, const std::string& source);

    // 停止时取消所有未结束任务
    void cancel_all();

    // 丢弃结束超过 retention 的任务，返回丢弃数量。新任务登记时自动调用
    size_t prune_finished(TimePoint now);

    size_t active_count() const;
    const PortPool& port_pool() const { return ports_; }

private:
    struct Session {
        explicit Session(asio::io_context& ioc);

        void close_io();

        std::shared_ptr<TransferTask> task;
        asio::strand<asio::io_context::executor_type> strand;
        std::unique_ptr<asio::ip::tcp::acceptor> acceptor;
        std::unique_ptr<asio::ip::tcp::socket> socket;
        asio::steady_timer handshake_timer;
        asio::steady_timer pause_timer;
        bool timed_out = false;
        bool port_released = false;
    };
    using SessionPtr = std::shared_ptr<Session>;

    void on_offer(const Packet& packet, const std::string& source);
    void on_release(const Packet& packet, const std::string& source);

    // 绑定监听端口，失败的端口跳过
    std::expected<uint16_t, ErrorCode> open_listener(Session& session);

    asio::awaitable<void> run_outgoing(SessionPtr session);
    asio::awaitable<void> run_incoming(SessionPtr session);
    asio::awaitable<void> serve_outgoing(SessionPtr session);
    asio::awaitable<void> receive_incoming(SessionPtr session);

    asio::awaitable<std::expected<Packet, ErrorCode>> read_request(Session& session);
    asio::awaitable<void> wait_while_paused(Session& session);

    void spawn(SessionPtr session, bool outgoing);

    // 超时后关闭会话 I/O，挂起的读写随之返回
    void arm_deadline(const SessionPtr& session);
    void report_progress(Session& session, bool force);

    // 进入终态并发布事件；已是终态时不做任何事
    bool finish(Session& session, TransferStatus status, std::string reason = {});
    void release_resources(Session& session);

    SessionPtr find(const std::string& task_id) const;
    void add_session(const SessionPtr& session);
    std::string unique_destination(const std::string& file_name) const;

    asio::io_context& ioc_;
    Outbox& outbox_;
    const PeerRegistry& registry_;
    EventBus& bus_;
    TransferConfig config_;
    PortPool ports_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, SessionPtr> sessions_;
    std::atomic<uint64_t> next_file_id_{0};
};

} // namespace neolan::core
