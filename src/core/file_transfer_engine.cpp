#include "core/file_transfer_engine.hpp"
#include "common/checksum.hpp"
#include "common/logger.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <filesystem>
#include <fstream>

namespace neolan::core {

namespace fs = std::filesystem;
using tcp = asio::ip::tcp;

namespace {
auto& log() { return Logger::get("core.transfer"); }

template<typename T>
bool parse_number(std::string_view s, T& out, int base) {
    if (s.empty()) return false;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out, base);
    return ec == std::errc() && ptr == s.data() + s.size();
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

// 文件名出现在附加段中，':' 为保留字符
std::string wire_file_name(const fs::path& path) {
    auto name = path.filename().string();
    std::replace(name.begin(), name.end(), protocol::DELIMITER, '_');
    return name;
}

uint64_t mtime_seconds(const fs::path& path) {
    std::error_code ec;
    auto ftime = fs::last_write_time(path, ec);
    if (ec) return 0;
    auto sys = std::chrono::file_clock::to_sys(ftime);
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(sys.time_since_epoch()).count();
    return secs > 0 ? static_cast<uint64_t>(secs) : 0;
}

void log_spawn_exit(std::exception_ptr ep) {
    if (ep) {
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            log().error("Transfer coroutine terminated: {}", e.what());
        }
    }
}

}  // anonymous namespace

// ============================================================================
// FileOffer / FileDataRequest
// ============================================================================

std::vector<std::string> FileOffer::to_extensions() const {
    std::vector<std::string> ext = {
        std::to_string(file_id),
        file_name,
        fmt::format("{:x}", file_size),
        fmt::format("{:x}", mtime),
        fmt::format("{:x}", attr),
    };
    if (port) {
        ext.push_back(fmt::format("port={}", *port));
    }
    if (md5) {
        ext.push_back("md5=" + *md5);
    }
    return ext;
}

std::optional<FileOffer> FileOffer::parse(const std::vector<std::string>& extensions) {
    if (extensions.size() < 5) {
        return std::nullopt;
    }

    FileOffer offer;
    if (!parse_number(extensions[0], offer.file_id, 10)) return std::nullopt;
    offer.file_name = extensions[1];
    if (offer.file_name.empty()) return std::nullopt;
    if (!parse_number(extensions[2], offer.file_size, 16)) return std::nullopt;
    if (!parse_number(extensions[3], offer.mtime, 16)) return std::nullopt;
    if (!parse_number(extensions[4], offer.attr, 16)) return std::nullopt;

    for (size_t i = 5; i < extensions.size(); ++i) {
        std::string_view field = extensions[i];
        if (field.starts_with("port=")) {
            uint16_t port = 0;
            if (parse_number(field.substr(5), port, 10) && port != 0) {
                offer.port = port;
            }
        } else if (field.starts_with("md5=")) {
            if (field.size() > 4) {
                offer.md5 = std::string(field.substr(4));
            }
        }
    }
    return offer;
}

std::string FileDataRequest::to_content() const {
    return fmt::format("{:x}:{:x}:{:x}", packet_id, file_id, offset);
}

std::optional<FileDataRequest> FileDataRequest::parse(std::string_view content) {
    auto first = content.find(protocol::DELIMITER);
    if (first == std::string_view::npos) return std::nullopt;
    auto second = content.find(protocol::DELIMITER, first + 1);
    if (second == std::string_view::npos) return std::nullopt;

    auto third = content.substr(second + 1);
    // 旧客户端可能在 offset 后再追加字段
    if (auto extra = third.find(protocol::DELIMITER); extra != std::string_view::npos) {
        third = third.substr(0, extra);
    }

    FileDataRequest req;
    if (!parse_number(content.substr(0, first), req.packet_id, 16)) return std::nullopt;
    if (!parse_number(content.substr(first + 1, second - first - 1), req.file_id, 16)) return std::nullopt;
    if (!parse_number(third, req.offset, 16)) return std::nullopt;
    return req;
}

// ============================================================================
// Session
// ============================================================================

FileTransferEngine::Session::Session(asio::io_context& ioc)
    : strand(asio::make_strand(ioc))
    , handshake_timer(strand)
    , pause_timer(strand) {}

void FileTransferEngine::Session::close_io() {
    boost::system::error_code ec;
    if (acceptor) {
        acceptor->close(ec);
    }
    if (socket) {
        socket->shutdown(tcp::socket::shutdown_both, ec);
        socket->close(ec);
    }
}

// ============================================================================
// FileTransferEngine
// ============================================================================

FileTransferEngine::FileTransferEngine(asio::io_context& ioc, Outbox& outbox,
                                       const PeerRegistry& registry, EventBus& bus,
                                       TransferConfig config)
    : ioc_(ioc)
    , outbox_(outbox)
    , registry_(registry)
    , bus_(bus)
    , config_(std::move(config))
    , ports_(config_.tcp_port_start, config_.tcp_port_end) {}

FileTransferEngine::~FileTransferEngine() = default;

std::expected<TransferInfo, ErrorCode> FileTransferEngine::request_send(
    const std::string& peer_address, const std::string& file_path) {

    std::error_code fec;
    fs::path path = fs::absolute(file_path, fec);
    if (fec || !fs::is_regular_file(path, fec)) {
        log().warn("Cannot send {}: not a regular file", file_path);
        return std::unexpected(ErrorCode::FILE_NOT_FOUND);
    }
    auto size = fs::file_size(path, fec);
    if (fec) {
        return std::unexpected(ErrorCode::FILE_IO);
    }

    auto peer = registry_.get(peer_address);
    if (!peer || peer->is_local) {
        return std::unexpected(ErrorCode::PEER_NOT_FOUND);
    }

    auto md5 = md5_file(path.string());
    if (!md5) {
        return std::unexpected(md5.error());
    }

    auto session = std::make_shared<Session>(ioc_);
    auto port = open_listener(*session);
    if (!port) {
        log().error("No TCP port available in [{}, {}]", config_.tcp_port_start, config_.tcp_port_end);
        return std::unexpected(port.error());
    }

    FileOffer offer;
    offer.file_id = next_file_id_.fetch_add(1) + 1;
    offer.file_name = wire_file_name(path);
    offer.file_size = size;
    offer.mtime = mtime_seconds(path);
    offer.port = *port;
    offer.md5 = *md5;

    auto packet = outbox_.make_packet(
        ipmsg::make_command(ipmsg::SENDMSG, ipmsg::FILEATTACHOPT), {}, offer.to_extensions());

    auto now = Clock::now();
    TransferInfo info;
    info.id = generate_uuid();
    info.direction = TransferDirection::OUTGOING;
    info.peer_address = peer_address;
    info.file_name = offer.file_name;
    info.file_path = path.string();
    info.file_size = size;
    info.checksum = *md5;
    info.status = TransferStatus::PENDING;
    info.tcp_port = *port;
    info.created_at = now;
    info.updated_at = now;
    info.packet_id = packet.packet_id;
    info.file_id = offer.file_id;

    session->task = std::make_shared<TransferTask>(info);
    add_session(session);

    auto sent = outbox_.send(peer_address, std::move(packet));
    if (!sent) {
        finish(*session, TransferStatus::FAILED, "offer could not be sent");
        release_resources(*session);
        return std::unexpected(ErrorCode::SEND_FAILED);
    }

    log().info("Offered {} ({} bytes) to {} on port {} [task {}]",
               info.file_name, size, peer_address, *port, info.id);

    spawn(session, true);
    return session->task->info();
}

std::expected<void, ErrorCode> FileTransferEngine::accept(const std::string& task_id) {
    auto session = find(task_id);
    if (!session) {
        return std::unexpected(ErrorCode::TASK_NOT_FOUND);
    }

    auto info = session->task->info();
    if (info.direction != TransferDirection::INCOMING || info.status != TransferStatus::PENDING) {
        return std::unexpected(ErrorCode::INVALID_STATE);
    }

    std::error_code fec;
    fs::create_directories(config_.save_dir, fec);

    // 预先创建文件占住名字
    auto destination = unique_destination(info.file_name);
    {
        std::ofstream reserve(destination, std::ios::binary | std::ios::trunc);
        if (!reserve) {
            log().error("Cannot create {}", destination);
            return std::unexpected(ErrorCode::FILE_IO);
        }
    }
    session->task->set_file_path(destination);

    if (auto r = session->task->transition(TransferStatus::ACTIVE); !r) {
        fs::remove(destination, fec);
        return r;
    }

    log().info("Accepted {} from {} -> {}", info.file_name, info.peer_address, destination);
    spawn(session, false);
    return {};
}

std::expected<void, ErrorCode> FileTransferEngine::reject(const std::string& task_id) {
    auto session = find(task_id);
    if (!session) {
        return std::unexpected(ErrorCode::TASK_NOT_FOUND);
    }

    auto info = session->task->info();
    if (info.direction != TransferDirection::INCOMING || info.status != TransferStatus::PENDING) {
        return std::unexpected(ErrorCode::INVALID_STATE);
    }
    if (!finish(*session, TransferStatus::CANCELLED, "rejected")) {
        return std::unexpected(ErrorCode::INVALID_STATE);
    }

    auto sent = outbox_.send(info.peer_address, ipmsg::RELEASEFILES, std::to_string(info.packet_id));
    if (!sent) {
        log().warn("Failed to notify {} of rejection: {}", info.peer_address,
                   error_code_to_string(sent.error()));
    }
    return {};
}

std::expected<void, ErrorCode> FileTransferEngine::cancel(const std::string& task_id) {
    auto session = find(task_id);
    if (!session) {
        return std::unexpected(ErrorCode::TASK_NOT_FOUND);
    }

    auto before = session->task->info();
    if (!finish(*session, TransferStatus::CANCELLED, "cancelled")) {
        if (session->task->status() == TransferStatus::CANCELLED) {
            return {};
        }
        return std::unexpected(ErrorCode::INVALID_STATE);
    }

    // 尚未接受的报价：按拒绝通知发送方
    if (before.direction == TransferDirection::INCOMING && before.status == TransferStatus::PENDING) {
        if (auto sent = outbox_.send(before.peer_address, ipmsg::RELEASEFILES,
                                     std::to_string(before.packet_id)); !sent) {
            log().warn("Failed to notify {} of cancellation", before.peer_address);
        }
    }

    asio::post(session->strand, [this, session] {
        release_resources(*session);
    });
    return {};
}

std::expected<void, ErrorCode> FileTransferEngine::pause(const std::string& task_id) {
    auto session = find(task_id);
    if (!session) {
        return std::unexpected(ErrorCode::TASK_NOT_FOUND);
    }
    if (auto r = session->task->transition(TransferStatus::PAUSED); !r) {
        return r;
    }
    log().info("Paused task {}", task_id);
    return {};
}

std::expected<void, ErrorCode> FileTransferEngine::resume(const std::string& task_id) {
    auto session = find(task_id);
    if (!session) {
        return std::unexpected(ErrorCode::TASK_NOT_FOUND);
    }
    if (session->task->status() != TransferStatus::PAUSED) {
        return std::unexpected(ErrorCode::INVALID_STATE);
    }
    if (auto r = session->task->transition(TransferStatus::ACTIVE); !r) {
        return r;
    }

    asio::post(session->strand, [session] { session->pause_timer.cancel(); });
    log().info("Resumed task {}", task_id);
    return {};
}

std::optional<TransferInfo> FileTransferEngine::get(const std::string& task_id) const {
    auto session = find(task_id);
    if (!session) {
        return std::nullopt;
    }
    return session->task->info();
}

std::vector<TransferInfo> FileTransferEngine::list() const {
    std::vector<TransferInfo> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result.reserve(sessions_.size());
        for (const auto& [_, session] : sessions_) {
            result.push_back(session->task->info());
        }
    }
    std::sort(result.begin(), result.end(), [](const TransferInfo& a, const TransferInfo& b) {
        return a.created_at < b.created_at;
    });
    return result;
}

void FileTransferEngine::cancel_all() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, session] : sessions_) {
            if (!is_terminal(session->task->status())) {
                ids.push_back(id);
            }
        }
    }
    for (const auto& id : ids) {
        (void)cancel(id);
    }
}

size_t FileTransferEngine::prune_finished(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto removed = std::erase_if(sessions_, [&](const auto& kv) {
        auto info = kv.second->task->info();
        return is_terminal(info.status) && now - info.updated_at > config_.retention;
    });
    if (removed > 0) {
        log().debug("Pruned {} finished transfer(s)", removed);
    }
    return removed;
}

size_t FileTransferEngine::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(sessions_.begin(), sessions_.end(), [](const auto& kv) {
        return !is_terminal(kv.second->task->status());
    }));
}

// ============================================================================
// UDP 握手
// ============================================================================

void FileTransferEngine::handle_packet(const Packet& packet, const std::string& source) {
    switch (packet.mode()) {
        case ipmsg::SENDMSG:
            if (packet.has_opt(ipmsg::FILEATTACHOPT)) {
                on_offer(packet, source);
            }
            break;
        case ipmsg::RELEASEFILES:
            on_release(packet, source);
            break;
        default:
            break;
    }
}

void FileTransferEngine::on_offer(const Packet& packet, const std::string& source) {
    auto offer = FileOffer::parse(packet.extensions);
    if (!offer) {
        log().warn("Malformed file offer from {} ({} extension fields)", source, packet.extensions.size());
        return;
    }
    if (ipmsg::get_mode(offer->attr) != ipmsg::FILE_REGULAR) {
        log().warn("Ignoring non-regular file offer '{}' from {}", offer->file_name, source);
        return;
    }

    {
        // 旧客户端会重发报价
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [_, session] : sessions_) {
            auto info = session->task->info();
            if (info.direction == TransferDirection::INCOMING && info.peer_address == source &&
                info.packet_id == packet.packet_id && info.file_id == offer->file_id) {
                return;
            }
        }
    }

    // 未带 port= 的报价按 IPMsg 惯例使用对端 UDP 端口
    uint16_t port = offer->port.value_or(network::DEFAULT_UDP_PORT);
    if (!offer->port) {
        if (auto peer = registry_.get(source)) {
            port = peer->port;
        }
    }

    auto now = Clock::now();
    TransferInfo info;
    info.id = generate_uuid();
    info.direction = TransferDirection::INCOMING;
    info.peer_address = source;
    info.file_name = offer->file_name;
    info.file_size = offer->file_size;
    info.checksum = offer->md5;
    info.status = TransferStatus::PENDING;
    info.tcp_port = port;
    info.created_at = now;
    info.updated_at = now;
    info.packet_id = packet.packet_id;
    info.file_id = offer->file_id;

    auto session = std::make_shared<Session>(ioc_);
    session->task = std::make_shared<TransferTask>(info);
    add_session(session);

    log().info("File offered by {}: {} ({} bytes) [task {}]", source, info.file_name,
               info.file_size, info.id);

    events::TransferOffered ev;
    ev.task = std::move(info);
    bus_.emit(ev);
}

void FileTransferEngine::on_release(const Packet& packet, const std::string& source) {
    uint64_t packet_id = 0;
    std::string_view content = packet.content;
    if (!parse_number(content, packet_id, 10)) {
        log().debug("Malformed RELEASEFILES from {}: '{}'", source, packet.content);
        return;
    }

    std::vector<SessionPtr> matched;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [_, session] : sessions_) {
            auto info = session->task->info();
            if (info.direction == TransferDirection::OUTGOING && info.peer_address == source &&
                info.packet_id == packet_id && info.status == TransferStatus::PENDING) {
                matched.push_back(session);
            }
        }
    }

    for (auto& session : matched) {
        if (finish(*session, TransferStatus::CANCELLED, "rejected by peer")) {
            asio::post(session->strand, [this, session] { release_resources(*session); });
        }
    }
}

// ============================================================================
// 协程
// ============================================================================

std::expected<uint16_t, ErrorCode> FileTransferEngine::open_listener(Session& session) {
    boost::system::error_code ec;
    auto address = asio::ip::make_address_v4(config_.bind_address, ec);
    if (ec) {
        return std::unexpected(ErrorCode::BIND_FAILED);
    }

    std::vector<uint16_t> failed;
    std::optional<uint16_t> bound;

    for (size_t attempt = 0; attempt < ports_.capacity(); ++attempt) {
        auto port = ports_.acquire();
        if (!port) {
            break;
        }

        auto acceptor = std::make_unique<tcp::acceptor>(session.strand);
        acceptor->open(tcp::v4(), ec);
        if (!ec) acceptor->set_option(tcp::acceptor::reuse_address(true), ec);
        if (!ec) acceptor->bind(tcp::endpoint(address, *port), ec);
        if (!ec) acceptor->listen(asio::socket_base::max_listen_connections, ec);

        if (ec) {
            log().debug("Port {} unavailable: {}", *port, ec.message());
            failed.push_back(*port);
            continue;
        }

        session.acceptor = std::move(acceptor);
        bound = *port;
        break;
    }

    for (auto port : failed) {
        ports_.release(port);
    }

    if (!bound) {
        return std::unexpected(ErrorCode::NO_PORT_AVAILABLE);
    }
    return *bound;
}

void FileTransferEngine::spawn(SessionPtr session, bool outgoing) {
    auto strand = session->strand;
    if (outgoing) {
        asio::co_spawn(strand, run_outgoing(std::move(session)), log_spawn_exit);
    } else {
        asio::co_spawn(strand, run_incoming(std::move(session)), log_spawn_exit);
    }
}

void FileTransferEngine::arm_deadline(const SessionPtr& session) {
    session->timed_out = false;
    session->handshake_timer.expires_after(config_.handshake_timeout);
    session->handshake_timer.async_wait([session](boost::system::error_code ec) {
        if (ec) {
            return;
        }
        session->timed_out = true;
        session->close_io();
    });
}

asio::awaitable<void> FileTransferEngine::run_outgoing(SessionPtr session) {
    try {
        co_await serve_outgoing(session);
    } catch (const std::exception& e) {
        log().error("Task {}: {}", session->task->id(), e.what());
        finish(*session, TransferStatus::FAILED, e.what());
    }
    release_resources(*session);
}

asio::awaitable<void> FileTransferEngine::run_incoming(SessionPtr session) {
    try {
        co_await receive_incoming(session);
    } catch (const std::exception& e) {
        log().error("Task {}: {}", session->task->id(), e.what());
        finish(*session, TransferStatus::FAILED, e.what());
    }

    // 失败时以 RST 断开，发送方据此区分未送达
    auto info = session->task->info();
    if (info.status != TransferStatus::COMPLETED && session->socket) {
        boost::system::error_code ec;
        session->socket->set_option(asio::socket_base::linger(true, 0), ec);
        session->socket->close(ec);
    }
    release_resources(*session);

    // 未完成的接收文件不保留
    if (info.status != TransferStatus::COMPLETED && !info.file_path.empty()) {
        std::error_code fec;
        fs::remove(info.file_path, fec);
    }
}

asio::awaitable<void> FileTransferEngine::serve_outgoing(SessionPtr session) {
    auto& s = *session;
    if (is_terminal(s.task->status())) {
        co_return;
    }

    arm_deadline(session);

    boost::system::error_code ec;
    auto socket = std::make_unique<tcp::socket>(s.strand);
    co_await s.acceptor->async_accept(*socket, asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        s.handshake_timer.cancel();
        if (s.timed_out) {
            finish(s, TransferStatus::FAILED, "handshake timeout");
        } else {
            finish(s, TransferStatus::FAILED, fmt::format("accept failed: {}", ec.message()));
        }
        co_return;
    }

    s.socket = std::move(socket);
    s.acceptor->close(ec);

    auto info = s.task->info();
    log().debug("Task {}: connection from {}", info.id,
                s.socket->remote_endpoint(ec).address().to_string());

    auto request = co_await read_request(s);
    s.handshake_timer.cancel();
    if (!request) {
        finish(s, TransferStatus::FAILED, s.timed_out ? "handshake timeout" : "invalid file request");
        co_return;
    }

    auto req = FileDataRequest::parse(request->content);
    if (request->mode() != ipmsg::GETFILEDATA || !req ||
        req->packet_id != info.packet_id || req->file_id != info.file_id) {
        log().warn("Task {}: unexpected request '{}'", info.id, request->content);
        finish(s, TransferStatus::FAILED, "invalid file request");
        co_return;
    }
    if (req->offset != 0) {
        log().debug("Task {}: ignoring resume offset {:x}", info.id, req->offset);
    }

    if (!s.task->transition(TransferStatus::ACTIVE)) {
        co_return;
    }

    std::ifstream in(info.file_path, std::ios::binary);
    if (!in) {
        finish(s, TransferStatus::FAILED, "cannot open source file");
        co_return;
    }

    std::array<char, network::TRANSFER_CHUNK_SIZE> buffer{};
    uint64_t sent = 0;

    while (sent < info.file_size) {
        co_await wait_while_paused(s);
        if (is_terminal(s.task->status())) {
            co_return;
        }

        auto want = static_cast<std::streamsize>(
            std::min<uint64_t>(buffer.size(), info.file_size - sent));
        in.read(buffer.data(), want);
        auto got = in.gcount();
        if (got <= 0) {
            finish(s, TransferStatus::FAILED, "source file read error");
            co_return;
        }

        co_await asio::async_write(*s.socket, asio::buffer(buffer.data(), static_cast<size_t>(got)),
                                   asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            finish(s, TransferStatus::FAILED, fmt::format("connection lost: {}", ec.message()));
            co_return;
        }

        sent += static_cast<uint64_t>(got);
        s.task->add_progress(static_cast<uint64_t>(got));
        report_progress(s, false);
    }

    // 接收方校验后关闭连接；只有正常关闭才算送达
    s.socket->shutdown(tcp::socket::shutdown_send, ec);
    arm_deadline(session);

    std::array<char, 16> tail{};
    auto extra = co_await s.socket->async_read_some(asio::buffer(tail),
                                                    asio::redirect_error(asio::use_awaitable, ec));
    s.handshake_timer.cancel();
    if (is_terminal(s.task->status())) {
        co_return;
    }
    if (ec == asio::error::eof && extra == 0) {
        finish(s, TransferStatus::COMPLETED);
    } else if (s.timed_out) {
        finish(s, TransferStatus::FAILED, "completion timeout");
    } else {
        finish(s, TransferStatus::FAILED, "unexpected disconnect");
    }
}

asio::awaitable<void> FileTransferEngine::receive_incoming(SessionPtr session) {
    auto& s = *session;
    if (is_terminal(s.task->status())) {
        co_return;
    }

    auto info = s.task->info();

    boost::system::error_code ec;
    auto address = asio::ip::make_address_v4(info.peer_address, ec);
    if (ec || !info.tcp_port) {
        finish(s, TransferStatus::FAILED, "invalid peer endpoint");
        co_return;
    }

    s.socket = std::make_unique<tcp::socket>(s.strand);
    co_await s.socket->async_connect(tcp::endpoint(address, *info.tcp_port),
                                     asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        finish(s, TransferStatus::FAILED, fmt::format("connect failed: {}", ec.message()));
        co_return;
    }

    FileDataRequest req;
    req.packet_id = info.packet_id;
    req.file_id = info.file_id;

    auto packet = outbox_.make_packet(ipmsg::GETFILEDATA, req.to_content());
    auto bytes = PacketCodec::encode(packet, registry_.charset_for(info.peer_address));
    if (!bytes) {
        finish(s, TransferStatus::FAILED, "cannot encode file request");
        co_return;
    }

    co_await asio::async_write(*s.socket, asio::buffer(*bytes),
                               asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        finish(s, TransferStatus::FAILED, fmt::format("request send failed: {}", ec.message()));
        co_return;
    }

    std::ofstream out(info.file_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        finish(s, TransferStatus::FAILED, "cannot create destination file");
        co_return;
    }

    Md5 md5;
    std::array<char, network::TRANSFER_CHUNK_SIZE> buffer{};
    uint64_t received = 0;

    while (received < info.file_size) {
        co_await wait_while_paused(s);
        if (is_terminal(s.task->status())) {
            co_return;
        }

        auto want = static_cast<size_t>(std::min<uint64_t>(buffer.size(), info.file_size - received));
        auto n = co_await s.socket->async_read_some(asio::buffer(buffer.data(), want),
                                                    asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            if (ec == asio::error::eof) {
                finish(s, TransferStatus::FAILED, "unexpected disconnect");
            } else {
                finish(s, TransferStatus::FAILED, fmt::format("connection lost: {}", ec.message()));
            }
            co_return;
        }

        out.write(buffer.data(), static_cast<std::streamsize>(n));
        if (!out) {
            finish(s, TransferStatus::FAILED, "destination write error");
            co_return;
        }

        md5.update(buffer.data(), n);
        received += n;
        s.task->add_progress(n);
        report_progress(s, false);
    }

    out.close();
    if (!out) {
        finish(s, TransferStatus::FAILED, "destination write error");
        co_return;
    }

    if (info.checksum) {
        auto digest = md5.final_hex();
        if (!iequals(digest, *info.checksum)) {
            log().warn("Task {}: checksum mismatch (expected {}, got {})", info.id, *info.checksum, digest);
            finish(s, TransferStatus::FAILED, "checksum mismatch");
            co_return;
        }
    }

    finish(s, TransferStatus::COMPLETED);
}

asio::awaitable<std::expected<Packet, ErrorCode>> FileTransferEngine::read_request(Session& s) {
    std::string data;
    std::array<char, 1024> chunk{};

    while (data.size() < protocol::MAX_DATAGRAM_SIZE) {
        boost::system::error_code ec;
        auto n = co_await s.socket->async_read_some(asio::buffer(chunk),
                                                    asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            co_return std::unexpected(ErrorCode::UNEXPECTED_EOF);
        }
        data.append(chunk.data(), n);

        // 请求在一次写入内发出；拿到完整的三段内容即可
        auto packet = PacketCodec::decode(data);
        if (packet && FileDataRequest::parse(packet->content)) {
            co_return *packet;
        }
    }
    co_return std::unexpected(ErrorCode::MESSAGE_TOO_LARGE);
}

asio::awaitable<void> FileTransferEngine::wait_while_paused(Session& s) {
    while (s.task->status() == TransferStatus::PAUSED) {
        s.pause_timer.expires_at(asio::steady_timer::time_point::max());
        boost::system::error_code ec;
        co_await s.pause_timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
    }
}

// ============================================================================
// 状态与事件
// ============================================================================

void FileTransferEngine::report_progress(Session& s, bool force) {
    bool due = s.task->progress_due(std::chrono::steady_clock::now(), config_.progress_interval);
    if (!due && !force) {
        return;
    }

    auto info = s.task->info();
    events::TransferProgress ev;
    ev.task_id = info.id;
    ev.transferred_bytes = info.transferred_bytes;
    ev.file_size = info.file_size;
    bus_.emit(ev);
}

bool FileTransferEngine::finish(Session& s, TransferStatus status, std::string reason) {
    // 最后一块写完后才被暂停的任务也算完成
    if (status == TransferStatus::COMPLETED && s.task->status() == TransferStatus::PAUSED) {
        (void)s.task->transition(TransferStatus::ACTIVE);
    }

    if (!s.task->transition(status, reason)) {
        return false;
    }

    auto info = s.task->info();
    if (status == TransferStatus::COMPLETED) {
        report_progress(s, true);
        log().info("Task {} completed: {} ({} bytes)", info.id, info.file_name, info.transferred_bytes);

        events::TransferCompleted ev;
        ev.task = std::move(info);
        bus_.emit(ev);
    } else {
        log().info("Task {} {}: {}", info.id, transfer_status_name(status), reason);

        events::TransferFailed ev;
        ev.task = std::move(info);
        ev.status = status;
        ev.reason = std::move(reason);
        bus_.emit(ev);
    }
    return true;
}

void FileTransferEngine::release_resources(Session& s) {
    s.close_io();
    s.handshake_timer.cancel();
    s.pause_timer.cancel();

    auto info = s.task->info();
    // cancel 与协程退出都会走到这里，端口只归还一次
    if (info.direction == TransferDirection::OUTGOING && info.tcp_port && !s.port_released) {
        s.port_released = true;
        ports_.release(*info.tcp_port);
    }
}

void FileTransferEngine::add_session(const SessionPtr& session) {
    prune_finished(Clock::now());
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_[session->task->id()] = session;
}

FileTransferEngine::SessionPtr FileTransferEngine::find(const std::string& task_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(task_id);
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second;
}

std::string FileTransferEngine::unique_destination(const std::string& file_name) const {
    fs::path name = fs::path(file_name).filename();
    if (name.empty() || name == "." || name == "..") {
        name = "unnamed";
    }

    fs::path dir(config_.save_dir);
    auto candidate = dir / name;
    std::error_code ec;
    for (int i = 1; fs::exists(candidate, ec); ++i) {
        candidate = dir / fmt::format("{} ({}){}", name.stem().string(), i, name.extension().string());
    }
    return candidate.string();
}

} // namespace neolan::core
