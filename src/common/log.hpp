#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace rmqconf {
namespace log {

// ============================================================================
// Logger Names
// ============================================================================
constexpr const char* MAIN_LOGGER = "rmqconf";
constexpr const char* CONF_LOGGER = "conf";
constexpr const char* CLI_LOGGER = "cli";

// ============================================================================
// Log Levels (runtime configurable)
// ============================================================================
enum class Level {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

// ============================================================================
// Log Configuration
// ============================================================================
struct LogConfig {
    Level level{Level::Info};
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v"};
    bool console{true};  // console output goes to stderr, stdout carries command output
    std::string file_path;
    size_t max_file_size{10 * 1024 * 1024};  // 10 MB
    size_t max_files{3};
};

// ============================================================================
// Initialization
// ============================================================================

// Initialize logging with the given configuration
void init(const LogConfig& config = LogConfig{});

// Initialize logging from environment variables
// RMQCONF_LOG_LEVEL: trace, debug, info, warn, error, critical, off
// RMQCONF_LOG_FILE: path to log file
// `fallback` is used as the level when RMQCONF_LOG_LEVEL is unset
void init_from_env(Level fallback = Level::Info);

// Parse a level name; nullopt for anything unrecognized
std::optional<Level> parse_level(std::string_view level);

// Get a logger by name, creates if doesn't exist
std::shared_ptr<spdlog::logger> get(const std::string& name = MAIN_LOGGER);

// Set log level for all loggers (runtime configurable)
void set_level(Level level);

// Get current log level
Level get_level();

// Check if a level is enabled (for conditional logging)
bool is_level_enabled(Level level);

// Flush all loggers
void flush();

// Shutdown logging
void shutdown();

// Convert Level to spdlog level
spdlog::level::level_enum to_spdlog_level(Level level);

// ============================================================================
// Logger class for component-specific logging
// ============================================================================

class Logger {
public:
    explicit Logger(const std::string& name) : name_(name) {}

    template<typename... Args>
    void trace(fmt::format_string<Args...> fmt, Args&&... args) const {
        if (is_level_enabled(Level::Trace)) {
            get(name_)->trace(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void debug(fmt::format_string<Args...> fmt, Args&&... args) const {
        if (is_level_enabled(Level::Debug)) {
            get(name_)->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> fmt, Args&&... args) const {
        if (is_level_enabled(Level::Info)) {
            get(name_)->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void warn(fmt::format_string<Args...> fmt, Args&&... args) const {
        if (is_level_enabled(Level::Warn)) {
            get(name_)->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> fmt, Args&&... args) const {
        if (is_level_enabled(Level::Error)) {
            get(name_)->error(fmt, std::forward<Args>(args)...);
        }
    }

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

} // namespace log
} // namespace rmqconf
