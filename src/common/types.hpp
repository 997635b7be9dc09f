#pragma once

#include "common/constants.hpp"
#include "common/protocol.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace neolan {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// ============================================================================
// Peer
// ============================================================================

enum class PeerStatus : uint8_t {
    ONLINE = 0,
    AWAY = 1,
    OFFLINE = 2,
};

const char* peer_status_name(PeerStatus status);

struct Peer {
    std::string address;                    // IPv4 点分十进制，注册表主键
    uint16_t port = network::DEFAULT_UDP_PORT;
    std::string username;
    std::string hostname;
    std::optional<std::string> nickname;
    std::set<std::string> groups;
    PeerStatus status = PeerStatus::ONLINE;
    TimePoint last_seen{};
    std::optional<TimePoint> offline_since;
    bool legacy_charset = false;            // 对端只懂 GBK
    bool is_local = false;                  // 本机哨兵，永不清除

    // nickname > username > address
    std::string display_name() const;

    bool online() const { return status != PeerStatus::OFFLINE; }
};

// ============================================================================
// Transfer
// ============================================================================

enum class TransferDirection : uint8_t {
    OUTGOING = 0,
    INCOMING = 1,
};

enum class TransferStatus : uint8_t {
    PENDING = 0,
    ACTIVE = 1,
    PAUSED = 2,
    COMPLETED = 3,
    FAILED = 4,
    CANCELLED = 5,
};

const char* transfer_direction_name(TransferDirection direction);
const char* transfer_status_name(TransferStatus status);

constexpr bool is_terminal(TransferStatus status) {
    return status == TransferStatus::COMPLETED ||
           status == TransferStatus::FAILED ||
           status == TransferStatus::CANCELLED;
}

// 状态机：单调前进，Active <-> Paused 除外，终态不可变
bool is_valid_transition(TransferStatus from, TransferStatus to);

// 传输任务快照（事件与查询返回值）
struct TransferInfo {
    std::string id;
    TransferDirection direction = TransferDirection::OUTGOING;
    std::string peer_address;
    std::string file_name;
    std::string file_path;
    uint64_t file_size = 0;
    std::optional<std::string> checksum;    // MD5 hex
    TransferStatus status = TransferStatus::PENDING;
    uint64_t transferred_bytes = 0;
    std::optional<uint16_t> tcp_port;
    std::optional<std::string> error;
    TimePoint created_at{};
    TimePoint updated_at{};

    // 协议关联：报价报文 id 与报价内的 file_id
    uint64_t packet_id = 0;
    uint64_t file_id = 0;

    double progress() const {
        return file_size == 0 ? 1.0
                              : static_cast<double>(transferred_bytes) / static_cast<double>(file_size);
    }
};

// UUID v4 字符串
std::string generate_uuid();

} // namespace neolan
