#include "core/outbox.hpp"
#include "core/peer_registry.hpp"
#include "common/logger.hpp"

#include <chrono>

namespace neolan::core {

namespace {
auto& log() { return Logger::get("core.outbox"); }

std::atomic<uint64_t>& packet_counter() {
    static std::atomic<uint64_t> counter{static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            Clock::now().time_since_epoch()).count()) & protocol::MAX_PACKET_ID};
    return counter;
}
}  // anonymous namespace

uint64_t next_packet_id() {
    auto id = packet_counter().fetch_add(1, std::memory_order_relaxed) + 1;
    return id & protocol::MAX_PACKET_ID;
}

Outbox::Outbox(PacketSender& sender, const PeerRegistry& registry, Identity identity,
               uint16_t udp_port, bool legacy_broadcast)
    : sender_(sender)
    , registry_(registry)
    , udp_port_(udp_port)
    , legacy_broadcast_(legacy_broadcast)
    , identity_(std::move(identity)) {}

Identity Outbox::identity() const {
    std::lock_guard<std::mutex> lock(identity_mutex_);
    return identity_;
}

Packet Outbox::make_packet(uint32_t command, std::string content,
                           std::vector<std::string> extensions) const {
    Packet packet;
    packet.packet_id = next_packet_id();
    {
        std::lock_guard<std::mutex> lock(identity_mutex_);
        packet.sender_name = identity_.username;
        packet.sender_host = identity_.hostname;
    }
    packet.command = command;
    packet.content = std::move(content);
    packet.extensions = std::move(extensions);
    return packet;
}

Packet Outbox::make_presence(uint32_t mode) const {
    auto id = identity();
    uint32_t opts = absent() ? ipmsg::ABSENCEOPT : 0;

    std::vector<std::string> ext;
    if (!id.group.empty()) {
        ext.push_back(id.group);
    }
    return make_packet(ipmsg::make_command(mode, opts), id.nickname, std::move(ext));
}

std::expected<uint64_t, ErrorCode> Outbox::send(const std::string& address, Packet packet) {
    auto peer = registry_.get(address);
    auto charset = (peer && peer->legacy_charset) ? Charset::Legacy : Charset::Utf8;
    uint16_t port = peer ? peer->port : udp_port_;

    auto bytes = PacketCodec::encode(packet, charset);
    if (!bytes) {
        log().warn("Failed to encode {} for {}: {}", ipmsg::command_name(packet.command),
                   address, error_code_to_string(bytes.error()));
        return std::unexpected(bytes.error());
    }

    if (auto r = sender_.send_to(address, port, *bytes); !r) {
        return std::unexpected(r.error());
    }

    log().trace("-> {} {} id={}", address, ipmsg::describe_command(packet.command), packet.packet_id);
    return packet.packet_id;
}

std::expected<uint64_t, ErrorCode> Outbox::send(const std::string& address, uint32_t command,
                                                std::string content,
                                                std::vector<std::string> extensions) {
    return send(address, make_packet(command, std::move(content), std::move(extensions)));
}

std::expected<uint64_t, ErrorCode> Outbox::broadcast(Packet packet) {
    auto charset = legacy_broadcast_ ? Charset::Legacy : Charset::Utf8;
    auto bytes = PacketCodec::encode(packet, charset);
    if (!bytes) {
        log().warn("Failed to encode broadcast {}: {}", ipmsg::command_name(packet.command),
                   error_code_to_string(bytes.error()));
        return std::unexpected(bytes.error());
    }

    if (auto r = sender_.broadcast(*bytes); !r) {
        return std::unexpected(r.error());
    }

    log().trace("-> broadcast {} id={}", ipmsg::describe_command(packet.command), packet.packet_id);
    return packet.packet_id;
}

} // namespace neolan::core
