#pragma once

#include "common/config.hpp"
#include "common/event_bus.hpp"
#include "core/file_transfer_engine.hpp"
#include "core/heartbeat_scheduler.hpp"
#include "core/message_service.hpp"
#include "core/outbox.hpp"
#include "core/peer_registry.hpp"
#include "core/peer_supervisor.hpp"
#include "core/udp_transport.hpp"

#include <boost/asio.hpp>

#include <atomic>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace neolan::core {

namespace asio = boost::asio;

// LanNode - 组装根
//
// 持有 io_context 与线程池、UDP 收发、注册表、事件总线、心跳、巡检、
// 文件传输与消息服务，并把收到的报文按 mode 分发给各组件。
class LanNode {
public:
    // sender 非空时替代 UDP 传输发送报文（接收仍走 handle_datagram）
    explicit LanNode(NodeConfig config, PacketSender* sender = nullptr);
    ~LanNode();

    LanNode(const LanNode&) = delete;
    LanNode& operator=(const LanNode&) = delete;

    // 绑定 UDP 端口失败时返回 BIND_FAILED，其余组件不启动
    std::expected<void, ErrorCode> start();

    // 广播 BR_EXIT，取消传输，停止后台任务并等待线程退出
    void stop();

    bool running() const { return running_.load(); }

    // 处理一个收到的数据报：解码、更新注册表、按 mode 分发
    void handle_datagram(std::span<const uint8_t> data, const std::string& source, uint16_t port);

    // ========================================================================
    // Commands
    // ========================================================================

    std::expected<uint64_t, ErrorCode> send_message(const std::string& address,
                                                    const std::string& content);

    std::expected<TransferInfo, ErrorCode> request_send(const std::string& address,
                                                        const std::string& file_path);
    std::expected<void, ErrorCode> accept(const std::string& task_id);
    std::expected<void, ErrorCode> reject(const std::string& task_id);
    std::expected<void, ErrorCode> cancel(const std::string& task_id);
    std::expected<void, ErrorCode> pause(const std::string& task_id);
    std::expected<void, ErrorCode> resume(const std::string& task_id);

    std::expected<void, ConfigError> set_heartbeat_interval(std::chrono::seconds interval);
    std::expected<void, ConfigError> set_peer_timeout(std::chrono::seconds timeout);

    // 切换离开状态并广播 BR_ABSENCE
    std::expected<void, ErrorCode> set_absent(bool absent);

    // ========================================================================
    // Queries
    // ========================================================================

    std::vector<Peer> peers() const { return registry_.snapshot(); }
    std::vector<TransferInfo> transfers() const { return engine_.list(); }

    std::shared_ptr<EventStream> events(size_t capacity = network::EVENT_STREAM_CAPACITY) {
        return bus_.subscribe_stream(capacity);
    }

    EventBus& bus() { return bus_; }
    const RuntimeSettings& settings() const { return settings_; }
    const NodeConfig& config() const { return config_; }
    Peer local() const { return registry_.local(); }

private:
    NodeConfig config_;
    std::vector<std::string> local_addresses_;

    asio::io_context ioc_;
    std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
    std::vector<std::thread> threads_;

    EventBus bus_;
    RuntimeSettings settings_;
    PeerRegistry registry_;
    UdpTransport transport_;
    PacketSender& sender_;
    Outbox outbox_;
    HeartbeatScheduler heartbeat_;
    PeerSupervisor supervisor_;
    FileTransferEngine engine_;
    MessageService messages_;

    std::mutex lifecycle_mutex_;
    std::atomic<bool> running_{false};
};

} // namespace neolan::core
