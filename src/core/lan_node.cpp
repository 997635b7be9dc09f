#include "core/lan_node.hpp"
#include "common/logger.hpp"

#include <algorithm>

namespace neolan::core {

namespace {
auto& log() { return Logger::get("core.node"); }

// 哨兵地址：显式绑定地址优先，否则取第一个本机接口地址
Peer make_local_peer(const NodeConfig& config, const std::vector<std::string>& addresses) {
    Peer local;
    if (config.bind_address != network::DEFAULT_BIND_IP) {
        local.address = config.bind_address;
    } else if (!addresses.empty()) {
        local.address = addresses.front();
    } else {
        local.address = "127.0.0.1";
    }
    local.port = config.udp_port;
    local.username = config.username;
    local.hostname = config.hostname;
    if (!config.nickname.empty()) {
        local.nickname = config.nickname;
    }
    if (!config.group.empty()) {
        local.groups.insert(config.group);
    }
    local.last_seen = Clock::now();
    local.is_local = true;
    return local;
}

SupervisorConfig supervisor_config(const NodeConfig& config) {
    SupervisorConfig sc;
    sc.check_interval = config.timeout_check_interval;
    sc.cleanup_interval = config.cleanup_interval;
    sc.offline_retention = config.offline_retention;
    sc.lock_bound = config.registry_lock_bound;
    return sc;
}

TransferConfig transfer_config(const NodeConfig& config) {
    TransferConfig tc;
    tc.bind_address = config.bind_address;
    tc.tcp_port_start = config.tcp_port_start;
    tc.tcp_port_end = config.tcp_port_end;
    tc.save_dir = config.save_dir;
    tc.handshake_timeout = config.handshake_timeout;
    tc.progress_interval = config.progress_interval;
    tc.retention = config.transfer_retention;
    return tc;
}

}  // anonymous namespace

LanNode::LanNode(NodeConfig config, PacketSender* sender)
    : config_(std::move(config))
    , local_addresses_(local_ipv4_addresses())
    , settings_(config_.heartbeat_interval, config_.peer_timeout)
    , registry_(bus_, make_local_peer(config_, local_addresses_))
    , transport_(ioc_, config_.bind_address, config_.udp_port, config_.broadcast_address)
    , sender_(sender ? *sender : static_cast<PacketSender&>(transport_))
    , outbox_(sender_, registry_,
              Identity{config_.username, config_.hostname, config_.nickname, config_.group},
              config_.udp_port, config_.legacy_broadcast)
    , heartbeat_(ioc_, outbox_, registry_, config_.heartbeat_interval)
    , supervisor_(ioc_, registry_, settings_, supervisor_config(config_))
    , engine_(ioc_, outbox_, registry_, bus_, transfer_config(config_))
    , messages_(outbox_, bus_) {
    for (const auto& address : local_addresses_) {
        registry_.add_local_address(address);
    }
}

LanNode::~LanNode() {
    stop();
}

std::expected<void, ErrorCode> LanNode::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_) {
        return {};
    }

    if (auto r = transport_.open(); !r) {
        return r;
    }

    transport_.start_receive([this](std::span<const uint8_t> data, const std::string& source,
                                    uint16_t port) {
        handle_datagram(data, source, port);
    });

    work_.emplace(asio::make_work_guard(ioc_));
    size_t thread_count = std::max<size_t>(1, config_.io_threads);
    for (size_t i = 0; i < thread_count; ++i) {
        threads_.emplace_back([this] {
            try {
                ioc_.run();
            } catch (const std::exception& e) {
                log().error("io thread terminated: {}", e.what());
            }
        });
    }

    running_ = true;
    heartbeat_.start();
    supervisor_.start();

    auto local = registry_.local();
    log().info("Node started as {}@{} ({}:{}, {} io threads)", config_.username, config_.hostname,
               local.address, transport_.port(), thread_count);
    return {};
}

void LanNode::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!running_.exchange(false)) {
        return;
    }

    log().info("Stopping node...");

    if (auto r = outbox_.broadcast(outbox_.make_packet(ipmsg::BR_EXIT)); !r) {
        log().warn("BR_EXIT broadcast failed: {}", error_code_to_string(r.error()));
    }

    engine_.cancel_all();
    heartbeat_.stop();
    supervisor_.stop();
    asio::post(ioc_, [this] { transport_.close(); });

    // 放掉 work guard，让协程自然退出；超过宽限期再强制停止
    work_.reset();
    auto deadline = std::chrono::steady_clock::now() + defaults::SHUTDOWN_GRACE;
    while (!ioc_.stopped() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (!ioc_.stopped()) {
        log().warn("Background tasks still running after grace period, forcing stop");
        ioc_.stop();
    }

    for (auto& t : threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
    threads_.clear();

    log().info("Node stopped");
}

void LanNode::handle_datagram(std::span<const uint8_t> data, const std::string& source, uint16_t port) {
    auto packet = PacketCodec::decode(data);
    if (!packet) {
        log().debug("Dropped {} bytes from {}: {}", data.size(), source,
                    error_code_to_string(packet.error()));
        return;
    }

    // 自己的广播
    if (registry_.is_local_address(source)) {
        return;
    }

    log().trace("<- {} {} id={}", source, ipmsg::describe_command(packet->command), packet->packet_id);

    registry_.on_packet_received(*packet, source, port, Clock::now());

    switch (packet->mode()) {
        case ipmsg::BR_ENTRY:
            if (auto r = outbox_.send(source, outbox_.make_presence(ipmsg::ANSENTRY)); !r) {
                log().debug("ANSENTRY to {} failed", source);
            }
            break;
        case ipmsg::SENDMSG:
            messages_.handle_packet(*packet, source);
            if (packet->has_opt(ipmsg::FILEATTACHOPT)) {
                engine_.handle_packet(*packet, source);
            }
            break;
        case ipmsg::RECVMSG:
            messages_.handle_packet(*packet, source);
            break;
        case ipmsg::RELEASEFILES:
            engine_.handle_packet(*packet, source);
            break;
        default:
            break;
    }
}

// ============================================================================
// Commands
// ============================================================================

std::expected<uint64_t, ErrorCode> LanNode::send_message(const std::string& address,
                                                         const std::string& content) {
    if (!running_) {
        return std::unexpected(ErrorCode::NOT_RUNNING);
    }
    return messages_.send_message(address, content);
}

std::expected<TransferInfo, ErrorCode> LanNode::request_send(const std::string& address,
                                                             const std::string& file_path) {
    if (!running_) {
        return std::unexpected(ErrorCode::NOT_RUNNING);
    }
    return engine_.request_send(address, file_path);
}

std::expected<void, ErrorCode> LanNode::accept(const std::string& task_id) {
    return engine_.accept(task_id);
}

std::expected<void, ErrorCode> LanNode::reject(const std::string& task_id) {
    return engine_.reject(task_id);
}

std::expected<void, ErrorCode> LanNode::cancel(const std::string& task_id) {
    return engine_.cancel(task_id);
}

std::expected<void, ErrorCode> LanNode::pause(const std::string& task_id) {
    return engine_.pause(task_id);
}

std::expected<void, ErrorCode> LanNode::resume(const std::string& task_id) {
    return engine_.resume(task_id);
}

std::expected<void, ConfigError> LanNode::set_heartbeat_interval(std::chrono::seconds interval) {
    if (auto r = settings_.set_heartbeat_interval(interval); !r) {
        return r;
    }
    return heartbeat_.set_interval(interval);
}

std::expected<void, ConfigError> LanNode::set_peer_timeout(std::chrono::seconds timeout) {
    if (auto r = settings_.set_peer_timeout(timeout); !r) {
        return r;
    }
    log().info("Peer timeout set to {}s", timeout.count());
    return {};
}

std::expected<void, ErrorCode> LanNode::set_absent(bool absent) {
    outbox_.set_absent(absent);
    registry_.set_local_status(absent ? PeerStatus::AWAY : PeerStatus::ONLINE);

    if (!running_) {
        return {};
    }
    auto sent = outbox_.broadcast(outbox_.make_presence(ipmsg::BR_ABSENCE));
    if (!sent) {
        return std::unexpected(sent.error());
    }
    return {};
}

} // namespace neolan::core
