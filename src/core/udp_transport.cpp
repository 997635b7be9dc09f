#include "core/udp_transport.hpp"
#include "common/logger.hpp"

#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <arpa/inet.h>

#include <cerrno>
#include <cstring>

namespace neolan::core {

namespace {
auto& log() { return Logger::get("core.udp"); }
}  // anonymous namespace

UdpTransport::UdpTransport(asio::io_context& ioc, std::string bind_address, uint16_t port,
                           std::string broadcast_address)
    : bind_address_(std::move(bind_address))
    , port_(port)
    , broadcast_address_(std::move(broadcast_address))
    , socket_(ioc) {}

UdpTransport::~UdpTransport() {
    close();
}

std::expected<void, ErrorCode> UdpTransport::open() {
    boost::system::error_code ec;
    auto address = asio::ip::make_address_v4(bind_address_, ec);
    if (ec) {
        log().error("Invalid bind address {}: {}", bind_address_, ec.message());
        return std::unexpected(ErrorCode::BIND_FAILED);
    }

    socket_.open(asio::ip::udp::v4(), ec);
    if (!ec) socket_.set_option(asio::socket_base::reuse_address(true), ec);
    if (!ec) socket_.set_option(asio::socket_base::broadcast(true), ec);
    if (!ec) socket_.bind(asio::ip::udp::endpoint(address, port_), ec);
    if (ec) {
        log().error("Failed to bind UDP {}:{}: {}", bind_address_, port_, ec.message());
        boost::system::error_code ignored;
        socket_.close(ignored);
        return std::unexpected(ErrorCode::BIND_FAILED);
    }

    // 端口 0 时取实际端口
    port_ = socket_.local_endpoint(ec).port();
    open_ = true;
    log().info("UDP listening on {}:{}", bind_address_, port_);
    return {};
}

void UdpTransport::close() {
    if (!open_.exchange(false)) {
        return;
    }
    boost::system::error_code ec;
    socket_.close(ec);
    log().debug("UDP socket closed ({} sent, {} received)", packets_sent_.load(), packets_received_.load());
}

void UdpTransport::start_receive(ReceiveHandler handler) {
    asio::co_spawn(socket_.get_executor(), recv_loop(std::move(handler)), [](std::exception_ptr ep) {
        if (ep) {
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                log().error("UDP receive loop terminated: {}", e.what());
            }
        }
    });
}

std::expected<void, ErrorCode> UdpTransport::send_to(const std::string& address, uint16_t port,
                                                     std::span<const uint8_t> data) {
    if (!open_) {
        return std::unexpected(ErrorCode::NOT_RUNNING);
    }

    boost::system::error_code ec;
    auto target = asio::ip::make_address_v4(address, ec);
    if (ec) {
        log().warn("Invalid destination address {}", address);
        return std::unexpected(ErrorCode::SEND_FAILED);
    }

    {
        std::lock_guard<std::mutex> lock(send_mutex_);
        socket_.send_to(asio::buffer(data.data(), data.size()),
                        asio::ip::udp::endpoint(target, port), 0, ec);
    }
    if (ec) {
        log().warn("UDP send to {}:{} failed: {}", address, port, ec.message());
        return std::unexpected(ErrorCode::SEND_FAILED);
    }

    packets_sent_.fetch_add(1);
    return {};
}

std::expected<void, ErrorCode> UdpTransport::broadcast(std::span<const uint8_t> data) {
    return send_to(broadcast_address_, port_, data);
}

asio::awaitable<void> UdpTransport::recv_loop(ReceiveHandler handler) {
    while (open_) {
        boost::system::error_code ec;
        auto bytes = co_await socket_.async_receive_from(
            asio::buffer(recv_buffer_), sender_endpoint_,
            asio::redirect_error(asio::use_awaitable, ec));

        if (ec) {
            if (ec == asio::error::operation_aborted || !open_) {
                break;
            }
            // ICMP 端口不可达等错误不影响后续接收
            log().debug("UDP recv error: {}", ec.message());
            continue;
        }

        packets_received_.fetch_add(1);
        if (!sender_endpoint_.address().is_v4()) {
            continue;
        }

        handler(std::span<const uint8_t>(recv_buffer_.data(), bytes),
                sender_endpoint_.address().to_string(), sender_endpoint_.port());
    }
    log().debug("UDP receive loop exited");
}

std::vector<std::string> local_ipv4_addresses() {
    std::vector<std::string> result;

    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) == -1) {
        log().error("getifaddrs failed: {}", strerror(errno));
        return result;
    }

    for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr) continue;
        if (ifa->ifa_addr->sa_family != AF_INET) continue;
        if (ifa->ifa_flags & IFF_LOOPBACK) continue;
        if (!(ifa->ifa_flags & IFF_UP)) continue;

        auto* addr = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr);
        char ip_str[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &addr->sin_addr, ip_str, sizeof(ip_str));

        std::string ip = ip_str;
        if (ip.starts_with("169.254")) continue;

        log().debug("Found local address {} on {}", ip, ifa->ifa_name);
        result.push_back(std::move(ip));
    }

    freeifaddrs(ifaddr);
    return result;
}

} // namespace neolan::core
