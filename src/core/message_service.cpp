#include "core/message_service.hpp"
#include "common/logger.hpp"

#include <charconv>

namespace neolan::core {

namespace {
auto& log() { return Logger::get("core.message"); }
}  // anonymous namespace

MessageService::MessageService(Outbox& outbox, EventBus& bus)
    : outbox_(outbox)
    , bus_(bus) {}

std::expected<uint64_t, ErrorCode> MessageService::send_message(const std::string& address,
                                                                const std::string& content) {
    auto packet_id = outbox_.send(
        address, ipmsg::make_command(ipmsg::SENDMSG, ipmsg::SENDCHECKOPT), content);
    if (!packet_id) {
        log().warn("Message to {} not sent: {}", address, error_code_to_string(packet_id.error()));
        return packet_id;
    }

    log().debug("Message {} sent to {} ({} bytes)", *packet_id, address, content.size());

    events::MessageSent ev;
    ev.to_address = address;
    ev.packet_id = *packet_id;
    ev.content = content;
    bus_.emit(ev);
    return packet_id;
}

void MessageService::handle_packet(const Packet& packet, const std::string& source) {
    switch (packet.mode()) {
        case ipmsg::SENDMSG:
            on_message(packet, source);
            break;
        case ipmsg::RECVMSG:
            on_receipt(packet, source);
            break;
        default:
            break;
    }
}

void MessageService::on_message(const Packet& packet, const std::string& source) {
    // 带附件的报文也要回执，内容交给传输引擎
    if (packet.has_opt(ipmsg::SENDCHECKOPT)) {
        auto ack = outbox_.send(source, ipmsg::RECVMSG, std::to_string(packet.packet_id));
        if (!ack) {
            log().warn("Failed to acknowledge {} from {}", packet.packet_id, source);
        }
    }

    if (packet.has_opt(ipmsg::FILEATTACHOPT)) {
        return;
    }

    received_.fetch_add(1);
    log().debug("Message {} from {}@{}", packet.packet_id, packet.sender_name, source);

    events::MessageReceived ev;
    ev.from_address = source;
    ev.sender_name = packet.sender_name;
    ev.packet_id = packet.packet_id;
    ev.content = packet.content;
    bus_.emit(ev);
}

void MessageService::on_receipt(const Packet& packet, const std::string& source) {
    uint64_t packet_id = 0;
    const auto& content = packet.content;
    auto [ptr, ec] = std::from_chars(content.data(), content.data() + content.size(), packet_id);
    if (ec != std::errc() || ptr != content.data() + content.size()) {
        log().debug("Malformed RECVMSG from {}: '{}'", source, content);
        return;
    }

    events::MessageAcknowledged ev;
    ev.from_address = source;
    ev.packet_id = packet_id;
    bus_.emit(ev);
}

} // namespace neolan::core
