#include "common/log.hpp"
#include <cstdlib>
#include <unordered_map>
#include <mutex>
#include <atomic>
#include <iostream>

namespace rmqconf::log {

namespace {

std::mutex g_mutex;
std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> g_loggers;
LogConfig g_config;
bool g_initialized = false;
std::atomic<Level> g_current_level{Level::Info};

std::shared_ptr<spdlog::logger> create_logger(const std::string& name) {
    std::vector<spdlog::sink_ptr> sinks;

    auto spdlog_level = to_spdlog_level(g_config.level);

    if (g_config.console) {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(spdlog_level);
        sinks.push_back(console_sink);
    }

    if (!g_config.file_path.empty()) {
        try {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                g_config.file_path,
                g_config.max_file_size,
                g_config.max_files
            );
            file_sink->set_level(spdlog_level);
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex& e) {
            std::cerr << "Failed to open log file " << g_config.file_path << ": " << e.what() << std::endl;
            g_config.file_path.clear();
        }
    }

    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(spdlog_level);
    logger->set_pattern(g_config.pattern);

    return logger;
}

} // anonymous namespace

spdlog::level::level_enum to_spdlog_level(Level level) {
    switch (level) {
        case Level::Trace: return spdlog::level::trace;
        case Level::Debug: return spdlog::level::debug;
        case Level::Info: return spdlog::level::info;
        case Level::Warn: return spdlog::level::warn;
        case Level::Error: return spdlog::level::err;
        case Level::Critical: return spdlog::level::critical;
        case Level::Off: return spdlog::level::off;
        default: return spdlog::level::info;
    }
}

std::optional<Level> parse_level(std::string_view level) {
    if (level == "trace") return Level::Trace;
    if (level == "debug") return Level::Debug;
    if (level == "info") return Level::Info;
    if (level == "warn" || level == "warning") return Level::Warn;
    if (level == "error" || level == "err") return Level::Error;
    if (level == "critical" || level == "crit") return Level::Critical;
    if (level == "off") return Level::Off;
    return std::nullopt;
}

void init(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_mutex);

    // Re-initialization rebuilds every logger with the new sinks
    g_loggers.clear();
    g_config = config;
    g_current_level.store(config.level, std::memory_order_relaxed);
    g_loggers[MAIN_LOGGER] = create_logger(MAIN_LOGGER);
    g_initialized = true;
}

void init_from_env(Level fallback) {
    LogConfig config;
    config.level = fallback;

    if (const char* level = std::getenv("RMQCONF_LOG_LEVEL")) {
        config.level = parse_level(level).value_or(fallback);
    }

    if (const char* file = std::getenv("RMQCONF_LOG_FILE")) {
        config.file_path = file;
    }

    init(config);
}

std::shared_ptr<spdlog::logger> get(const std::string& name) {
    std::lock_guard<std::mutex> lock(g_mutex);

    // Auto-initialize with the current g_config (set_level may have run first)
    if (!g_initialized) {
        g_loggers[MAIN_LOGGER] = create_logger(MAIN_LOGGER);
        g_initialized = true;
    }

    auto it = g_loggers.find(name);
    if (it != g_loggers.end()) {
        return it->second;
    }

    auto logger = create_logger(name);
    g_loggers[name] = logger;
    return logger;
}

void set_level(Level level) {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_config.level = level;
    g_current_level.store(level, std::memory_order_relaxed);

    auto spdlog_level = to_spdlog_level(level);

    for (auto& [name, logger] : g_loggers) {
        logger->set_level(spdlog_level);
        for (auto& sink : logger->sinks()) {
            sink->set_level(spdlog_level);
        }
    }
}

Level get_level() {
    return g_current_level.load(std::memory_order_relaxed);
}

bool is_level_enabled(Level level) {
    auto current = g_current_level.load(std::memory_order_relaxed);
    if (current == Level::Off) return false;
    return static_cast<int>(level) >= static_cast<int>(current);
}

void flush() {
    std::lock_guard<std::mutex> lock(g_mutex);
    for (auto& [name, logger] : g_loggers) {
        logger->flush();
    }
}

void shutdown() {
    std::lock_guard<std::mutex> lock(g_mutex);
    for (auto& [name, logger] : g_loggers) {
        logger->flush();
    }
    g_loggers.clear();
    g_initialized = false;
}

} // namespace rmqconf::log
