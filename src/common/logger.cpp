#include "common/logger.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace neolan {

// ============================================================================
// Log Level Utilities
// ============================================================================

LogLevel log_level_from_string(std::string_view str) {
    std::string lower;
    lower.reserve(str.size());
    for (char c : str) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "trace" || lower == "verbose") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error" || lower == "err") return LogLevel::ERROR;
    if (lower == "fatal" || lower == "critical") return LogLevel::FATAL;
    if (lower == "off") return LogLevel::OFF;

    return LogLevel::INFO;  // Default
}

std::string_view log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "trace";
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO:  return "info";
        case LogLevel::WARN:  return "warn";
        case LogLevel::ERROR: return "error";
        case LogLevel::FATAL: return "fatal";
        case LogLevel::OFF:   return "off";
    }
    return "info";
}

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO:  return spdlog::level::info;
        case LogLevel::WARN:  return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::FATAL: return spdlog::level::critical;
        case LogLevel::OFF:   return spdlog::level::off;
    }
    return spdlog::level::info;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger(const std::string& module, std::shared_ptr<spdlog::logger> logger)
    : module_(module), logger_(std::move(logger)) {}

Logger& Logger::get(const std::string& module) {
    return LogManager::instance().get_logger(module);
}

void Logger::set_level(LogLevel level) {
    if (logger_) logger_->set_level(to_spdlog_level(level));
}

LogLevel Logger::get_level() const {
    if (!logger_) return LogLevel::OFF;
    switch (logger_->level()) {
        case spdlog::level::trace:    return LogLevel::TRACE;
        case spdlog::level::debug:    return LogLevel::DEBUG;
        case spdlog::level::info:     return LogLevel::INFO;
        case spdlog::level::warn:     return LogLevel::WARN;
        case spdlog::level::err:      return LogLevel::ERROR;
        case spdlog::level::critical: return LogLevel::FATAL;
        default:                      return LogLevel::OFF;
    }
}

// ============================================================================
// LogManager
// ============================================================================

LogManager& LogManager::instance() {
    static LogManager instance;
    return instance;
}

LogManager::LogManager() {
    // 未调用 init() 前也能输出到控制台
    build_sinks();
}

LogManager::~LogManager() {
    shutdown();
}

void LogManager::init(const LogConfig& config) {
    std::unique_lock lock(mutex_);

    config_ = config;
    build_sinks();

    // 已创建的 logger 切换到新的 sink 和级别
    for (auto& [name, logger] : loggers_) {
        auto fresh = create_logger(name);
        logger->logger_ = fresh;
    }
}

void LogManager::build_sinks() {
    sinks_.clear();

    if (config_.console_enabled) {
        spdlog::sink_ptr console;
        if (config_.console_color) {
            console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        } else {
            console = std::make_shared<spdlog::sinks::stderr_sink_mt>();
        }
        console->set_pattern(config_.pattern);
        sinks_.push_back(std::move(console));
    }

    if (config_.file_enabled && !config_.file_path.empty()) {
        try {
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config_.file_path, config_.file_max_size, config_.file_max_files);
            file->set_pattern(config_.pattern);
            sinks_.push_back(std::move(file));
        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Failed to open log file " << config_.file_path << ": " << ex.what() << std::endl;
        }
    }
}

std::shared_ptr<spdlog::logger> LogManager::create_logger(const std::string& name) {
    auto logger = std::make_shared<spdlog::logger>(name, sinks_.begin(), sinks_.end());
    logger->set_level(to_spdlog_level(resolve_module_level(name)));
    logger->flush_on(spdlog::level::warn);
    return logger;
}

void LogManager::set_global_level(LogLevel level) {
    std::unique_lock lock(mutex_);
    config_.global_level = level;

    for (auto& [name, logger] : loggers_) {
        logger->set_level(resolve_module_level(name));
    }
}

LogLevel LogManager::get_global_level() const {
    std::shared_lock lock(mutex_);
    return config_.global_level;
}

void LogManager::set_module_level(const std::string& module, LogLevel level) {
    std::unique_lock lock(mutex_);
    config_.module_levels[module] = level;

    // 子模块继承父模块级别
    for (auto& [name, logger] : loggers_) {
        if (name == module || name.rfind(module + ".", 0) == 0) {
            logger->set_level(resolve_module_level(name));
        }
    }
}

std::optional<LogLevel> LogManager::get_module_level(const std::string& module) const {
    std::shared_lock lock(mutex_);
    auto it = config_.module_levels.find(module);
    if (it != config_.module_levels.end()) {
        return it->second;
    }
    return std::nullopt;
}

void LogManager::flush() {
    std::shared_lock lock(mutex_);
    for (auto& [_, logger] : loggers_) {
        if (logger->logger_) logger->logger_->flush();
    }
}

void LogManager::shutdown() {
    flush();
}

Logger& LogManager::get_logger(const std::string& module) {
    // Fast path: check if logger exists
    {
        std::shared_lock lock(mutex_);
        auto it = loggers_.find(module);
        if (it != loggers_.end()) {
            return *it->second;
        }
    }

    // Slow path: create new logger
    std::unique_lock lock(mutex_);

    // Double-check after acquiring write lock
    auto it = loggers_.find(module);
    if (it != loggers_.end()) {
        return *it->second;
    }

    auto logger = std::unique_ptr<Logger>(new Logger(module, create_logger(module)));
    auto& ref = *logger;
    loggers_[module] = std::move(logger);

    return ref;
}

LogLevel LogManager::resolve_module_level(const std::string& module) const {
    auto it = config_.module_levels.find(module);
    if (it != config_.module_levels.end()) {
        return it->second;
    }

    // Check for parent module level (e.g., "core.registry" inherits from "core")
    std::string parent = module;
    size_t dot_pos = parent.rfind('.');
    while (dot_pos != std::string::npos) {
        parent = parent.substr(0, dot_pos);
        auto parent_it = config_.module_levels.find(parent);
        if (parent_it != config_.module_levels.end()) {
            return parent_it->second;
        }
        dot_pos = parent.rfind('.');
    }

    return config_.global_level;
}

} // namespace neolan
