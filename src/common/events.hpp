// Typed events published by the node core.
// Each event derives TypedEvent<T> for EventBus::subscribe<T>; AnyEvent is the
// variant delivered to stream subscribers, matched exhaustively with std::visit.

#pragma once

#include "common/types.hpp"

#include <cstdint>
#include <string>
#include <typeindex>
#include <variant>

namespace neolan {

// ============================================================================
// Event Base Class
// ============================================================================

struct Event {
    virtual ~Event() = default;
    virtual std::type_index type() const = 0;
};

template<typename T>
struct TypedEvent : Event {
    std::type_index type() const override { return std::type_index(typeid(T)); }
};

namespace events {

// ============================================================================
// Peer events
// ============================================================================

struct PeerOnline : TypedEvent<PeerOnline> {
    Peer peer;
    std::string reason;         // "new" | "re-entry"
};

struct PeerOffline : TypedEvent<PeerOffline> {
    Peer peer;
    std::string reason;         // "explicit" | "timeout"
};

struct PeerStatusChanged : TypedEvent<PeerStatusChanged> {
    Peer peer;
    PeerStatus previous = PeerStatus::ONLINE;
};

struct PeerRemoved : TypedEvent<PeerRemoved> {
    std::string address;
    std::string display_name;
};

// ============================================================================
// Message events
// ============================================================================

struct MessageReceived : TypedEvent<MessageReceived> {
    std::string from_address;
    std::string sender_name;
    uint64_t packet_id = 0;
    std::string content;
};

struct MessageSent : TypedEvent<MessageSent> {
    std::string to_address;
    uint64_t packet_id = 0;
    std::string content;
};

struct MessageAcknowledged : TypedEvent<MessageAcknowledged> {
    std::string from_address;
    uint64_t packet_id = 0;
};

// ============================================================================
// Transfer events
// ============================================================================

struct TransferOffered : TypedEvent<TransferOffered> {
    TransferInfo task;
};

struct TransferProgress : TypedEvent<TransferProgress> {
    std::string task_id;
    uint64_t transferred_bytes = 0;
    uint64_t file_size = 0;
};

struct TransferCompleted : TypedEvent<TransferCompleted> {
    TransferInfo task;
};

struct TransferFailed : TypedEvent<TransferFailed> {
    TransferInfo task;
    TransferStatus status = TransferStatus::FAILED;   // FAILED | CANCELLED
    std::string reason;
};

} // namespace events

using AnyEvent = std::variant<
    events::PeerOnline,
    events::PeerOffline,
    events::PeerStatusChanged,
    events::PeerRemoved,
    events::MessageReceived,
    events::MessageSent,
    events::MessageAcknowledged,
    events::TransferOffered,
    events::TransferProgress,
    events::TransferCompleted,
    events::TransferFailed
>;

const char* event_name(const AnyEvent& event);

} // namespace neolan
