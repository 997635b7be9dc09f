#pragma once

#include "common/event_bus.hpp"
#include "common/packet.hpp"
#include "core/outbox.hpp"

#include <atomic>
#include <expected>
#include <string>

namespace neolan::core {

// 文本消息：SENDMSG 发送与接收、SENDCHECKOPT 回执
class MessageService {
public:
    MessageService(Outbox& outbox, EventBus& bus);

    // 发送 SENDMSG|SENDCHECKOPT，返回报文 id
    std::expected<uint64_t, ErrorCode> send_message(const std::string& address,
                                                    const std::string& content);

    // SENDMSG（不含文件附件）与 RECVMSG
    void handle_packet(const Packet& packet, const std::string& source);

    uint64_t messages_received() const { return received_.load(); }

private:
    void on_message(const Packet& packet, const std::string& source);
    void on_receipt(const Packet& packet, const std::string& source);

    Outbox& outbox_;
    EventBus& bus_;
    std::atomic<uint64_t> received_{0};
};

} // namespace neolan::core
