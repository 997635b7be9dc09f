#include "common/config.hpp"
#include "common/logger.hpp"
#include "core/lan_node.hpp"

#include <boost/asio.hpp>

#include <poll.h>
#include <unistd.h>

#include <atomic>
#include <charconv>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace neolan;
using namespace neolan::core;

namespace {

std::atomic<bool> g_quit{false};

void print_usage(const char* program) {
    std::cout << "neolan - LAN messenger (IPMsg / FeiQ compatible)\n\n"
              << "Usage: " << program << " [options]\n\n"
              << "Options:\n"
              << "  -c, --config <file>   Config file (JSON)\n"
              << "  -u, --user <name>     Username (overrides config)\n"
              << "  -p, --port <port>     UDP port (default: 2425)\n"
              << "  -l, --log-level <l>   Log level: trace/debug/info/warn/error\n"
              << "  -h, --help            Show help\n\n"
              << "Console commands:\n"
              << "  peers                       List known peers\n"
              << "  send <ip> <text>            Send a message\n"
              << "  sendfile <ip> <path>        Offer a file\n"
              << "  accept|reject <id>          Answer a file offer\n"
              << "  cancel|pause|resume <id>    Control a transfer\n"
              << "  transfers                   List transfers\n"
              << "  heartbeat <seconds>         Set heartbeat interval\n"
              << "  timeout <seconds>           Set peer timeout\n"
              << "  away on|off                 Toggle absence\n"
              << "  loglevel [<module> [<l>]]   Show or set log level ('*' = global)\n"
              << "  quit                        Exit\n"
              << std::endl;
}

std::string format_time(TimePoint tp) {
    auto t = Clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%H:%M:%S");
    return oss.str();
}

std::string format_size(uint64_t bytes) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1);
    if (bytes >= 1024ull * 1024 * 1024) {
        oss << static_cast<double>(bytes) / (1024.0 * 1024 * 1024) << " GiB";
    } else if (bytes >= 1024ull * 1024) {
        oss << static_cast<double>(bytes) / (1024.0 * 1024) << " MiB";
    } else if (bytes >= 1024) {
        oss << static_cast<double>(bytes) / 1024.0 << " KiB";
    } else {
        return std::to_string(bytes) + " B";
    }
    return oss.str();
}

void print_event(const AnyEvent& event) {
    std::visit([](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, events::PeerOnline>) {
            std::cout << "[+] " << e.peer.display_name() << " (" << e.peer.address << ") online, "
                      << e.reason << "\n";
        } else if constexpr (std::is_same_v<T, events::PeerOffline>) {
            std::cout << "[-] " << e.peer.display_name() << " (" << e.peer.address << ") offline, "
                      << e.reason << "\n";
        } else if constexpr (std::is_same_v<T, events::PeerStatusChanged>) {
            std::cout << "[~] " << e.peer.display_name() << " is now "
                      << peer_status_name(e.peer.status) << "\n";
        } else if constexpr (std::is_same_v<T, events::PeerRemoved>) {
            std::cout << "[x] " << e.display_name << " (" << e.address << ") removed\n";
        } else if constexpr (std::is_same_v<T, events::MessageReceived>) {
            std::cout << "<" << e.sender_name << "@" << e.from_address << "> " << e.content << "\n";
        } else if constexpr (std::is_same_v<T, events::MessageSent>) {
            std::cout << "-> " << e.to_address << " #" << e.packet_id << "\n";
        } else if constexpr (std::is_same_v<T, events::MessageAcknowledged>) {
            std::cout << "ack " << e.from_address << " #" << e.packet_id << "\n";
        } else if constexpr (std::is_same_v<T, events::TransferOffered>) {
            std::cout << "[file] " << e.task.peer_address << " offers " << e.task.file_name << " ("
                      << format_size(e.task.file_size) << "), id " << e.task.id << "\n";
        } else if constexpr (std::is_same_v<T, events::TransferProgress>) {
            // 进度太频繁，只在 transfers 命令中展示
        } else if constexpr (std::is_same_v<T, events::TransferCompleted>) {
            std::cout << "[file] " << e.task.file_name << " completed (" << e.task.id << ")\n";
        } else if constexpr (std::is_same_v<T, events::TransferFailed>) {
            std::cout << "[file] " << e.task.file_name << " " << transfer_status_name(e.status)
                      << ": " << e.reason << " (" << e.task.id << ")\n";
        }
    }, event);
    std::cout.flush();
}

void print_peers(const std::vector<Peer>& peers) {
    std::cout << std::left
              << std::setw(16) << "ADDRESS"
              << std::setw(24) << "NAME"
              << std::setw(18) << "HOST"
              << std::setw(9) << "STATUS"
              << "LAST SEEN\n";
    std::cout << std::string(76, '-') << "\n";
    for (const auto& p : peers) {
        std::cout << std::left
                  << std::setw(16) << p.address
                  << std::setw(24) << (p.display_name() + (p.is_local ? " *" : ""))
                  << std::setw(18) << p.hostname
                  << std::setw(9) << peer_status_name(p.status)
                  << format_time(p.last_seen) << "\n";
    }
}

void print_transfers(const std::vector<TransferInfo>& transfers) {
    if (transfers.empty()) {
        std::cout << "No transfers.\n";
        return;
    }
    for (const auto& t : transfers) {
        std::cout << t.id << "  "
                  << (t.direction == TransferDirection::OUTGOING ? "-> " : "<- ")
                  << std::left << std::setw(16) << t.peer_address
                  << std::setw(10) << transfer_status_name(t.status)
                  << std::right << std::setw(6) << std::fixed << std::setprecision(1)
                  << t.progress() * 100.0 << "%  "
                  << t.file_name << " (" << format_size(t.file_size) << ")";
        if (t.error) {
            std::cout << "  [" << *t.error << "]";
        }
        std::cout << "\n";
    }
}

template<typename T>
bool parse_seconds(const std::string& s, T& out) {
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc() && ptr == s.data() + s.size();
}

void report(const std::expected<void, ErrorCode>& r) {
    if (r) {
        std::cout << "ok\n";
    } else {
        std::cout << "error: " << error_code_to_string(r.error()) << "\n";
    }
}

void report(const std::expected<void, ConfigError>& r) {
    if (r) {
        std::cout << "ok\n";
    } else {
        std::cout << "error: " << config_error_message(r.error()) << "\n";
    }
}

// loglevel                   全局级别
// loglevel <module>          模块当前生效的级别
// loglevel <module|*> <l>    设置级别，子模块随之生效
void handle_loglevel(const std::string& module, const std::string& level) {
    auto& logs = LogManager::instance();
    if (module.empty()) {
        std::cout << "global: " << log_level_to_string(logs.get_global_level()) << "\n";
        return;
    }
    if (level.empty()) {
        auto own = logs.get_module_level(module);
        std::cout << module << ": " << log_level_to_string(Logger::get(module).get_level())
                  << (own ? "" : " (inherited)") << "\n";
        return;
    }

    auto parsed = log_level_from_string(level);
    if (log_level_to_string(parsed) != level) {
        std::cout << "usage: loglevel <module|*> trace|debug|info|warn|error|fatal|off\n";
        return;
    }
    if (module == "*") {
        logs.set_global_level(parsed);
    } else {
        logs.set_module_level(module, parsed);
    }
    std::cout << "ok\n";
}

// 返回 false 表示退出
bool handle_command(LanNode& node, const std::string& line) {
    std::istringstream iss(line);
    std::string cmd;
    iss >> cmd;
    if (cmd.empty()) {
        return true;
    }

    std::string arg;
    iss >> arg;
    std::string rest;
    std::getline(iss >> std::ws, rest);

    if (cmd == "quit" || cmd == "exit") {
        return false;
    } else if (cmd == "help") {
        print_usage("neolan");
    } else if (cmd == "peers") {
        print_peers(node.peers());
    } else if (cmd == "transfers") {
        print_transfers(node.transfers());
    } else if (cmd == "send" && !arg.empty() && !rest.empty()) {
        auto r = node.send_message(arg, rest);
        if (!r) {
            std::cout << "error: " << error_code_to_string(r.error()) << "\n";
        }
    } else if (cmd == "sendfile" && !arg.empty() && !rest.empty()) {
        auto r = node.request_send(arg, rest);
        if (r) {
            std::cout << "offered " << r->file_name << " on port " << r->tcp_port.value_or(0)
                      << ", id " << r->id << "\n";
        } else {
            std::cout << "error: " << error_code_to_string(r.error()) << "\n";
        }
    } else if (cmd == "accept" && !arg.empty()) {
        report(node.accept(arg));
    } else if (cmd == "reject" && !arg.empty()) {
        report(node.reject(arg));
    } else if (cmd == "cancel" && !arg.empty()) {
        report(node.cancel(arg));
    } else if (cmd == "pause" && !arg.empty()) {
        report(node.pause(arg));
    } else if (cmd == "resume" && !arg.empty()) {
        report(node.resume(arg));
    } else if (cmd == "heartbeat" || cmd == "timeout") {
        int64_t seconds = 0;
        if (!parse_seconds(arg, seconds)) {
            std::cout << "usage: " << cmd << " <seconds>\n";
        } else if (cmd == "heartbeat") {
            report(node.set_heartbeat_interval(std::chrono::seconds(seconds)));
        } else {
            report(node.set_peer_timeout(std::chrono::seconds(seconds)));
        }
    } else if (cmd == "away" && (arg == "on" || arg == "off")) {
        report(node.set_absent(arg == "on"));
    } else if (cmd == "loglevel") {
        handle_loglevel(arg, rest);
    } else {
        std::cout << "unknown command, type 'help'\n";
    }
    std::cout.flush();
    return true;
}

// 标准输入按行读取，定期检查退出标志。stdin 关闭后只等待信号
bool read_line(std::string& line) {
    bool stdin_open = true;
    while (!g_quit.load()) {
        if (!stdin_open) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            continue;
        }
        struct pollfd pfd{STDIN_FILENO, POLLIN, 0};
        int ready = ::poll(&pfd, 1, 200);
        if (ready <= 0) {
            continue;
        }
        if (std::getline(std::cin, line)) {
            return true;
        }
        stdin_open = false;
    }
    return false;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    std::string config_file;
    std::string username;
    std::string log_level;
    uint16_t port = 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_file = argv[++i];
        }
        else if ((arg == "-u" || arg == "--user") && i + 1 < argc) {
            username = argv[++i];
        }
        else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            std::string value = argv[++i];
            if (!parse_seconds(value, port) || port == 0) {
                std::cerr << "Invalid port: " << value << "\n";
                return 1;
            }
        }
        else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
            log_level = argv[++i];
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    NodeConfig config;
    if (!config_file.empty()) {
        auto loaded = NodeConfig::load(config_file);
        if (!loaded) {
            std::cerr << "Error: " << config_file << ": " << config_error_message(loaded.error()) << "\n";
            return 1;
        }
        config = std::move(*loaded);
    }

    // 命令行覆盖
    if (!username.empty()) config.username = username;
    if (port != 0) config.udp_port = port;
    if (!log_level.empty()) config.log_level = log_level;

    config.resolve_identity();
    if (auto r = config.validate(); !r) {
        std::cerr << "Error: invalid configuration: " << config_error_message(r.error()) << "\n";
        return 1;
    }

    LogManager::instance().init(config.log_config());
    auto& log = Logger::get("daemon");
    log.info("neolan starting as {}@{}", config.username, config.hostname);

    try {
        LanNode node(config);
        if (auto r = node.start(); !r) {
            log.error("Failed to start: {}", error_code_to_string(r.error()));
            LogManager::instance().shutdown();
            return 1;
        }

        // 事件打印
        auto stream = node.events();
        std::thread printer([stream] {
            while (!stream->closed() || stream->size() > 0) {
                if (auto ev = stream->pop(std::chrono::milliseconds(200))) {
                    print_event(*ev);
                }
            }
        });

        boost::asio::io_context signal_ioc;
        boost::asio::signal_set signals(signal_ioc, SIGINT, SIGTERM);
        signals.async_wait([&log](const boost::system::error_code& ec, int signo) {
            if (!ec) {
                log.info("Received signal {}, shutting down", signo);
                g_quit = true;
            }
        });
        std::thread signal_thread([&signal_ioc] { signal_ioc.run(); });

        std::string line;
        while (read_line(line)) {
            if (!handle_command(node, line)) {
                break;
            }
        }

        g_quit = true;
        boost::asio::post(signal_ioc, [&signals] { signals.cancel(); });
        signal_thread.join();

        node.stop();
        stream->close();
        printer.join();

    } catch (const std::exception& e) {
        log.error("Fatal: {}", e.what());
        LogManager::instance().shutdown();
        return 1;
    }

    log.info("neolan stopped");
    LogManager::instance().shutdown();
    return 0;
}
