#include "core/peer_registry.hpp"
#include "common/logger.hpp"

#include <algorithm>
#include <mutex>

namespace neolan::core {

namespace {
auto& log() { return Logger::get("core.registry"); }

// 把报文里的非空字段合并进 peer，不覆盖为空
void merge_fields(Peer& peer, const Packet& packet, uint16_t port) {
    if (!packet.sender_name.empty()) peer.username = packet.sender_name;
    if (!packet.sender_host.empty()) peer.hostname = packet.sender_host;
    if (port != 0) peer.port = port;
    peer.legacy_charset = packet.is_legacy_client() || !packet.has_opt(ipmsg::UTF8OPT);

    if (ipmsg::is_presence(packet.command)) {
        if (!packet.content.empty()) {
            peer.nickname = packet.content;
        }
        if (!packet.extensions.empty() && !packet.extensions.front().empty()) {
            peer.groups.insert(packet.extensions.front());
        }
    }
}

PeerStatus presence_status(const Packet& packet) {
    return packet.has_opt(ipmsg::ABSENCEOPT) ? PeerStatus::AWAY : PeerStatus::ONLINE;
}

}  // anonymous namespace

PeerRegistry::PeerRegistry(EventBus& bus, Peer local)
    : bus_(bus)
    , local_key_(local.address) {
    local.is_local = true;
    local.status = PeerStatus::ONLINE;
    local_addresses_.insert(local.address);
    peers_.emplace(local_key_, std::move(local));
}

// ============================================================================
// 报文驱动
// ============================================================================

void PeerRegistry::on_packet_received(const Packet& packet, const std::string& source,
                                      uint16_t port, TimePoint now) {
    if (packet.mode() == ipmsg::BR_EXIT) {
        mark_exit(source, now);
        return;
    }

    std::vector<AnyEvent> pending;
    {
        std::unique_lock lock(mutex_);
        if (local_addresses_.contains(source)) {
            return;
        }

        bool presence = ipmsg::is_presence(packet.command);
        auto it = peers_.find(source);

        if (it == peers_.end()) {
            Peer peer;
            peer.address = source;
            peer.status = presence ? presence_status(packet) : PeerStatus::ONLINE;
            peer.last_seen = now;
            merge_fields(peer, packet, port);

            log().info("Peer online: {} ({}) [new]", peer.display_name(), source);
            events::PeerOnline ev;
            ev.peer = peer;
            ev.reason = "new";
            pending.emplace_back(std::move(ev));
            peers_.emplace(source, std::move(peer));
        } else {
            auto& peer = it->second;
            auto previous = peer.status;
            merge_fields(peer, packet, port);
            peer.last_seen = std::max(peer.last_seen, now);

            if (previous == PeerStatus::OFFLINE) {
                peer.status = presence ? presence_status(packet) : PeerStatus::ONLINE;
                peer.offline_since.reset();

                log().info("Peer online: {} ({}) [re-entry]", peer.display_name(), source);
                events::PeerOnline ev;
                ev.peer = peer;
                ev.reason = "re-entry";
                pending.emplace_back(std::move(ev));
            } else if (presence && presence_status(packet) != previous) {
                peer.status = presence_status(packet);

                log().debug("Peer {} status {} -> {}", source,
                            peer_status_name(previous), peer_status_name(peer.status));
                events::PeerStatusChanged ev;
                ev.peer = peer;
                ev.previous = previous;
                pending.emplace_back(std::move(ev));
            }
        }
    }
    publish(pending);
}

bool PeerRegistry::mark_exit(const std::string& address, TimePoint now) {
    std::vector<AnyEvent> pending;
    {
        std::unique_lock lock(mutex_);
        if (local_addresses_.contains(address)) {
            return false;
        }
        auto it = peers_.find(address);
        if (it == peers_.end() || it->second.status == PeerStatus::OFFLINE) {
            return false;
        }

        auto& peer = it->second;
        peer.status = PeerStatus::OFFLINE;
        peer.offline_since = now;
        peer.last_seen = std::max(peer.last_seen, now);

        log().info("Peer offline: {} ({}) [explicit]", peer.display_name(), address);
        events::PeerOffline ev;
        ev.peer = peer;
        ev.reason = "explicit";
        pending.emplace_back(std::move(ev));
    }
    publish(pending);
    return true;
}

// ============================================================================
// 后台任务钩子
// ============================================================================

std::optional<size_t> PeerRegistry::expire_stale(std::chrono::seconds timeout, TimePoint now,
                                                 std::chrono::milliseconds lock_bound) {
    std::vector<AnyEvent> pending;
    {
        std::unique_lock lock(mutex_, std::defer_lock);
        if (!lock.try_lock_for(lock_bound)) {
            return std::nullopt;
        }

        for (auto& [address, peer] : peers_) {
            if (peer.is_local || peer.status == PeerStatus::OFFLINE) {
                continue;
            }
            if (now - peer.last_seen <= timeout) {
                continue;
            }

            peer.status = PeerStatus::OFFLINE;
            peer.offline_since = now;

            log().info("Peer offline: {} ({}) [timeout]", peer.display_name(), address);
            events::PeerOffline ev;
            ev.peer = peer;
            ev.reason = "timeout";
            pending.emplace_back(std::move(ev));
        }
    }
    auto expired = pending.size();
    publish(pending);
    return expired;
}

std::optional<size_t> PeerRegistry::evict_offline(std::chrono::seconds retention, TimePoint now,
                                                  std::chrono::milliseconds lock_bound) {
    std::vector<AnyEvent> pending;
    {
        std::unique_lock lock(mutex_, std::defer_lock);
        if (!lock.try_lock_for(lock_bound)) {
            return std::nullopt;
        }

        for (auto it = peers_.begin(); it != peers_.end();) {
            const auto& peer = it->second;
            bool expired = !peer.is_local &&
                           peer.status == PeerStatus::OFFLINE &&
                           peer.offline_since &&
                           now - *peer.offline_since > retention;
            if (!expired) {
                ++it;
                continue;
            }

            log().debug("Evicting peer {} ({})", peer.display_name(), it->first);
            events::PeerRemoved ev;
            ev.address = it->first;
            ev.display_name = peer.display_name();
            pending.emplace_back(std::move(ev));
            it = peers_.erase(it);
        }
    }
    auto removed = pending.size();
    publish(pending);
    return removed;
}

// ============================================================================
// 本机哨兵
// ============================================================================

void PeerRegistry::touch_local(TimePoint now) {
    std::unique_lock lock(mutex_);
    auto& local = peers_.at(local_key_);
    local.last_seen = std::max(local.last_seen, now);
}

void PeerRegistry::set_local_status(PeerStatus status) {
    std::unique_lock lock(mutex_);
    peers_.at(local_key_).status = status;
}

Peer PeerRegistry::local() const {
    std::shared_lock lock(mutex_);
    return peers_.at(local_key_);
}

void PeerRegistry::add_local_address(const std::string& address) {
    std::unique_lock lock(mutex_);
    local_addresses_.insert(address);
}

bool PeerRegistry::is_local_address(const std::string& address) const {
    std::shared_lock lock(mutex_);
    return local_addresses_.contains(address);
}

// ============================================================================
// 查询
// ============================================================================

std::optional<Peer> PeerRegistry::get(const std::string& address) const {
    std::shared_lock lock(mutex_);
    auto it = peers_.find(address);
    if (it == peers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Peer> PeerRegistry::snapshot() const {
    std::shared_lock lock(mutex_);
    std::vector<Peer> result;
    result.reserve(peers_.size());
    for (const auto& [_, peer] : peers_) {
        result.push_back(peer);
    }
    std::sort(result.begin(), result.end(),
              [](const Peer& a, const Peer& b) { return a.address < b.address; });
    return result;
}

Charset PeerRegistry::charset_for(const std::string& address) const {
    std::shared_lock lock(mutex_);
    auto it = peers_.find(address);
    if (it != peers_.end() && it->second.legacy_charset) {
        return Charset::Legacy;
    }
    return Charset::Utf8;
}

size_t PeerRegistry::peer_count() const {
    std::shared_lock lock(mutex_);
    return peers_.size();
}

size_t PeerRegistry::online_peer_count() const {
    std::shared_lock lock(mutex_);
    size_t count = 0;
    for (const auto& [_, peer] : peers_) {
        if (peer.online()) {
            ++count;
        }
    }
    return count;
}

void PeerRegistry::publish(std::vector<AnyEvent>& pending) {
    for (auto& event : pending) {
        std::visit([this](const auto& e) { bus_.emit(e); }, event);
    }
}

} // namespace neolan::core
