#pragma once

#include "common/packet.hpp"
#include "common/protocol.hpp"

#include <atomic>
#include <cstdint>
#include <expected>
#include <mutex>
#include <span>
#include <string>
#include <vector>

namespace neolan::core {

class PeerRegistry;

// 数据报发送接口（UdpTransport 实现，测试中可替换）
class PacketSender {
public:
    virtual ~PacketSender() = default;

    virtual std::expected<void, ErrorCode> send_to(const std::string& address, uint16_t port,
                                                   std::span<const uint8_t> data) = 0;
    virtual std::expected<void, ErrorCode> broadcast(std::span<const uint8_t> data) = 0;
};

// 进程内单调递增的报文 id，以启动时的秒数为种子
uint64_t next_packet_id();

// 本机身份
struct Identity {
    std::string username;
    std::string hostname;
    std::string nickname;
    std::string group;
};

// Outbox - 以本机身份组包，按目标选择字符集后编码发送
class Outbox {
public:
    Outbox(PacketSender& sender, const PeerRegistry& registry, Identity identity,
           uint16_t udp_port, bool legacy_broadcast);

    Packet make_packet(uint32_t command, std::string content = {},
                       std::vector<std::string> extensions = {}) const;

    // presence 报文：content = 昵称，extension[0] = 分组，离开时带 ABSENCEOPT
    Packet make_presence(uint32_t mode) const;

    // 单播到对端，返回报文 id
    std::expected<uint64_t, ErrorCode> send(const std::string& address, Packet packet);
    std::expected<uint64_t, ErrorCode> send(const std::string& address, uint32_t command,
                                            std::string content = {},
                                            std::vector<std::string> extensions = {});

    std::expected<uint64_t, ErrorCode> broadcast(Packet packet);

    void set_absent(bool absent) { absent_.store(absent, std::memory_order_relaxed); }
    bool absent() const { return absent_.load(std::memory_order_relaxed); }

    Identity identity() const;
    uint16_t udp_port() const { return udp_port_; }

private:
    PacketSender& sender_;
    const PeerRegistry& registry_;
    uint16_t udp_port_;
    bool legacy_broadcast_;

    mutable std::mutex identity_mutex_;
    Identity identity_;
    std::atomic<bool> absent_{false};
};

} // namespace neolan::core
