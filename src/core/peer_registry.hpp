#pragma once

#include "common/event_bus.hpp"
#include "common/packet.hpp"
#include "common/types.hpp"

#include <chrono>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace neolan::core {

// Peer 注册表 - 按 IPv4 地址唯一保存对端，维护在线状态机
//
//   (absent)      -> Online/Away   首个报文           PeerOnline{"new"}
//   Online/Away   -> Offline       BR_EXIT / 超时     PeerOffline{"explicit"|"timeout"}
//   Offline       -> Online/Away   任意后续报文       PeerOnline{"re-entry"}
//   Online <-> Away                presence 报文      PeerStatusChanged
//
// 事件在锁内收集、锁外发布。所有时间由调用方传入。
class PeerRegistry {
public:
    PeerRegistry(EventBus& bus, Peer local);

    // ========================================================================
    // 报文驱动
    // ========================================================================

    // 处理任意来源报文；本机地址的报文被忽略。BR_EXIT 等价于 mark_exit
    void on_packet_received(const Packet& packet, const std::string& source,
                            uint16_t port, TimePoint now);

    // 显式下线；返回是否发生状态变化
    bool mark_exit(const std::string& address, TimePoint now);

    // ========================================================================
    // 后台任务钩子（有界加锁，拿不到锁返回 nullopt）
    // ========================================================================

    std::optional<size_t> expire_stale(std::chrono::seconds timeout, TimePoint now,
                                       std::chrono::milliseconds lock_bound);

    std::optional<size_t> evict_offline(std::chrono::seconds retention, TimePoint now,
                                        std::chrono::milliseconds lock_bound);

    // ========================================================================
    // 本机哨兵
    // ========================================================================

    void touch_local(TimePoint now);
    void set_local_status(PeerStatus status);
    Peer local() const;

    void add_local_address(const std::string& address);
    bool is_local_address(const std::string& address) const;

    // ========================================================================
    // 查询
    // ========================================================================

    std::optional<Peer> get(const std::string& address) const;
    std::vector<Peer> snapshot() const;

    // 发往该地址应使用的字符集（未知对端按 UTF-8）
    Charset charset_for(const std::string& address) const;

    size_t peer_count() const;
    size_t online_peer_count() const;

private:
    void publish(std::vector<AnyEvent>& pending);

    EventBus& bus_;
    std::string local_key_;

    mutable std::shared_timed_mutex mutex_;
    std::unordered_map<std::string, Peer> peers_;
    std::set<std::string> local_addresses_;
};

} // namespace neolan::core
