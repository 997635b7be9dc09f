#include "common/types.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace neolan {

const char* peer_status_name(PeerStatus status) {
    switch (status) {
        case PeerStatus::ONLINE: return "online";
        case PeerStatus::AWAY: return "away";
        case PeerStatus::OFFLINE: return "offline";
        default: return "unknown";
    }
}

std::string Peer::display_name() const {
    if (nickname && !nickname->empty()) return *nickname;
    if (!username.empty()) return username;
    return address;
}

const char* transfer_direction_name(TransferDirection direction) {
    switch (direction) {
        case TransferDirection::OUTGOING: return "outgoing";
        case TransferDirection::INCOMING: return "incoming";
        default: return "unknown";
    }
}

const char* transfer_status_name(TransferStatus status) {
    switch (status) {
        case TransferStatus::PENDING: return "pending";
        case TransferStatus::ACTIVE: return "active";
        case TransferStatus::PAUSED: return "paused";
        case TransferStatus::COMPLETED: return "completed";
        case TransferStatus::FAILED: return "failed";
        case TransferStatus::CANCELLED: return "cancelled";
        default: return "unknown";
    }
}

bool is_valid_transition(TransferStatus from, TransferStatus to) {
    if (is_terminal(from)) return false;

    switch (to) {
        case TransferStatus::PENDING:
            return false;
        case TransferStatus::ACTIVE:
            return from == TransferStatus::PENDING || from == TransferStatus::PAUSED;
        case TransferStatus::PAUSED:
            return from == TransferStatus::ACTIVE;
        case TransferStatus::COMPLETED:
            return from == TransferStatus::ACTIVE;
        case TransferStatus::FAILED:
        case TransferStatus::CANCELLED:
            return true;
    }
    return false;
}

std::string generate_uuid() {
    thread_local boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}

} // namespace neolan
