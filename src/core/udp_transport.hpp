#pragma once

#include "core/outbox.hpp"

#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>

#include <array>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <vector>

namespace neolan::core {

namespace asio = boost::asio;

// UDP 收发：绑定 IPMsg 端口，单播 / 广播发送，协程接收循环
class UdpTransport : public PacketSender {
public:
    using ReceiveHandler = std::function<void(std::span<const uint8_t> data,
                                              const std::string& address, uint16_t port)>;

    UdpTransport(asio::io_context& ioc, std::string bind_address, uint16_t port,
                 std::string broadcast_address);
    ~UdpTransport() override;

    UdpTransport(const UdpTransport&) = delete;
    UdpTransport& operator=(const UdpTransport&) = delete;

    std::expected<void, ErrorCode> open();
    void close();

    // 启动接收循环；handler 在 io 线程上调用
    void start_receive(ReceiveHandler handler);

    std::expected<void, ErrorCode> send_to(const std::string& address, uint16_t port,
                                           std::span<const uint8_t> data) override;
    std::expected<void, ErrorCode> broadcast(std::span<const uint8_t> data) override;

    bool is_open() const { return open_.load(); }
    uint16_t port() const { return port_; }

    uint64_t packets_sent() const { return packets_sent_.load(); }
    uint64_t packets_received() const { return packets_received_.load(); }

private:
    asio::awaitable<void> recv_loop(ReceiveHandler handler);

    std::string bind_address_;
    uint16_t port_;
    std::string broadcast_address_;

    asio::ip::udp::socket socket_;
    std::mutex send_mutex_;
    std::array<uint8_t, protocol::MAX_DATAGRAM_SIZE> recv_buffer_{};
    asio::ip::udp::endpoint sender_endpoint_;

    std::atomic<bool> open_{false};
    std::atomic<uint64_t> packets_sent_{0};
    std::atomic<uint64_t> packets_received_{0};
};

// 本机 IPv4 地址（跳过 loopback、未启用接口与 169.254/16）
std::vector<std::string> local_ipv4_addresses();

} // namespace neolan::core
