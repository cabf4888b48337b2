/**
 * @file logger.h
 * @brief Structured logging API for mpd-launcher
 *
 * Provides a unified logging interface using spdlog.
 * Supports stderr output, rotating file output, configurable log levels
 * and journald-friendly output when started by systemd.
 */

#pragma once

#include <cstdint>
#include <cstdlib>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

// Forward declare spdlog logger
namespace spdlog {
class logger;
}  // namespace spdlog

namespace mpd_launcher {
namespace logging {

/**
 * @brief Log level enumeration
 */
enum class LogLevel : std::uint8_t {
    Trace,     // Very detailed debugging information
    Debug,     // Debug information
    Info,      // General information
    Warn,      // Warnings
    Error,     // Errors
    Critical,  // Critical errors
    Off        // Disable logging
};

/**
 * @brief Logging configuration
 */
struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::string filePath = "";                                   // Empty = no file output
    size_t maxFileSize = static_cast<size_t>(10 * 1024 * 1024);  // 10 MB
    size_t maxBackups = 5;
    bool consoleOutput = true;
    bool coloredOutput = true;
    bool systemdOutput = false;  // Prefix records with <N> syslog priority
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
};

/**
 * @brief Pattern used when systemdOutput is set.
 *
 * journald adds its own timestamp; %* expands to the syslog priority.
 */
constexpr const char* kSystemdPattern = "%*%n: %v";

/**
 * @brief Initialize the logging system
 *
 * Replaces any previously installed logger.
 *
 * @param config Logging configuration
 * @return true if initialization succeeded, false otherwise
 */
bool initialize(const LogConfig& config = LogConfig{});

/**
 * @brief Early initialization with stderr output only
 *
 * Lightweight initialization for logging before the launcher config file
 * is available.
 *
 * @return true if initialization succeeded, false otherwise
 */
bool initializeEarly();

/**
 * @brief Shutdown the logging system
 *
 * Flushes all pending log messages and closes every sink. Called before
 * exec, which would otherwise drop buffered records and leak the log file
 * descriptor into the new image.
 */
void shutdown();

// Applies to the logger and every sink
void setLevel(LogLevel level);

/**
 * @brief Get the underlying spdlog logger
 *
 * For advanced use cases only.
 */
std::shared_ptr<spdlog::logger> getLogger();

/**
 * @brief Convert LogLevel to string
 */
std::string_view levelToString(LogLevel level);

/**
 * @brief Convert string to LogLevel
 *
 * @param str Level name (case-insensitive)
 * @return Corresponding LogLevel, defaults to Info if unknown
 */
LogLevel stringToLevel(std::string_view str);

/**
 * @brief Check whether a level name is recognised by stringToLevel
 */
bool isValidLevelName(std::string_view str);

/**
 * @brief syslog priority used for a level in systemd output
 *
 * error/critical -> 3, warn -> 4, info -> 6, debug/trace -> 7
 */
int toSyslogPriority(LogLevel level);

/**
 * @brief Detect whether the process runs as a systemd service
 *
 * True when SYSTEMD_EXEC_PID is set and stderr is not a terminal.
 */
bool runningUnderSystemd(
    const std::function<const char*(const char*)>& getenvFn = ::getenv);

}  // namespace logging
}  // namespace mpd_launcher

// Include spdlog for macro usage
#include <spdlog/spdlog.h>

#define LOG_DEBUG(...)                                     \
    do {                                                   \
        auto logger = mpd_launcher::logging::getLogger();  \
        if (logger)                                        \
            SPDLOG_LOGGER_DEBUG(logger, __VA_ARGS__);      \
    } while (0)

#define LOG_INFO(...)                                      \
    do {                                                   \
        auto logger = mpd_launcher::logging::getLogger();  \
        if (logger)                                        \
            SPDLOG_LOGGER_INFO(logger, __VA_ARGS__);       \
    } while (0)

#define LOG_WARN(...)                                      \
    do {                                                   \
        auto logger = mpd_launcher::logging::getLogger();  \
        if (logger)                                        \
            SPDLOG_LOGGER_WARN(logger, __VA_ARGS__);       \
    } while (0)

#define LOG_ERROR(...)                                     \
    do {                                                   \
        auto logger = mpd_launcher::logging::getLogger();  \
        if (logger)                                        \
            SPDLOG_LOGGER_ERROR(logger, __VA_ARGS__);      \
    } while (0)
