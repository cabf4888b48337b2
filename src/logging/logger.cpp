/**
 * @file logger.cpp
 * @brief Implementation of structured logging for mpd-launcher
 */

#include "mpd_launcher/logging/logger.h"

#include "mpd_launcher/core/launcher_constants.h"

#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <unistd.h>
#include <vector>

namespace mpd_launcher {
namespace logging {

namespace {

constexpr const char* kLoggerName = "mpd-launcher";

// Global logger instance
std::shared_ptr<spdlog::logger> g_logger;
std::mutex g_init_mutex;
std::atomic<bool> g_initialized{false};

// Convert our LogLevel to spdlog::level::level_enum
spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return spdlog::level::trace;
    case LogLevel::Debug:
        return spdlog::level::debug;
    case LogLevel::Info:
        return spdlog::level::info;
    case LogLevel::Warn:
        return spdlog::level::warn;
    case LogLevel::Error:
        return spdlog::level::err;
    case LogLevel::Critical:
        return spdlog::level::critical;
    case LogLevel::Off:
        return spdlog::level::off;
    default:
        return spdlog::level::info;
    }
}

// Convert spdlog::level to our LogLevel
LogLevel fromSpdlogLevel(spdlog::level::level_enum level) {
    switch (level) {
    case spdlog::level::trace:
        return LogLevel::Trace;
    case spdlog::level::debug:
        return LogLevel::Debug;
    case spdlog::level::info:
        return LogLevel::Info;
    case spdlog::level::warn:
        return LogLevel::Warn;
    case spdlog::level::err:
        return LogLevel::Error;
    case spdlog::level::critical:
        return LogLevel::Critical;
    case spdlog::level::off:
        return LogLevel::Off;
    default:
        return LogLevel::Info;
    }
}

// %* flag: "<N>" syslog priority prefix understood by journald
class SyslogPriorityFlag : public spdlog::custom_flag_formatter {
   public:
    void format(const spdlog::details::log_msg& msg, const std::tm& /*tm_time*/,
                spdlog::memory_buf_t& dest) override {
        const std::string prefix =
            "<" + std::to_string(toSyslogPriority(fromSpdlogLevel(msg.level))) + ">";
        dest.append(prefix.data(), prefix.data() + prefix.size());
    }

    std::unique_ptr<custom_flag_formatter> clone() const override {
        return std::make_unique<SyslogPriorityFlag>();
    }
};

std::unique_ptr<spdlog::formatter> makeFormatter(const LogConfig& config) {
    auto formatter = std::make_unique<spdlog::pattern_formatter>();
    if (config.systemdOutput) {
        formatter->add_flag<SyslogPriorityFlag>('*').set_pattern(kSystemdPattern);
    } else {
        formatter->set_pattern(config.pattern);
    }
    return formatter;
}

std::string toLower(std::string_view str) {
    std::string lower;
    lower.reserve(str.size());
    for (char c : str) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return lower;
}

}  // namespace

bool initialize(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_init_mutex);

    try {
        std::vector<spdlog::sink_ptr> sinks;

        // Console sink (stderr: stdout is handed over to mpd)
        if (config.consoleOutput) {
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_level(toSpdlogLevel(config.level));
            if (!config.coloredOutput || config.systemdOutput) {
                console_sink->set_color_mode(spdlog::color_mode::never);
            }
            sinks.push_back(console_sink);
        }

        // Rotating file sink
        if (!config.filePath.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.filePath, config.maxFileSize, config.maxBackups);
            file_sink->set_level(toSpdlogLevel(config.level));
            sinks.push_back(file_sink);
        }

        if (g_logger) {
            g_logger->flush();
            spdlog::drop(kLoggerName);
        }

        g_logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
        g_logger->set_level(toSpdlogLevel(config.level));
        g_logger->set_formatter(makeFormatter(config));

        spdlog::set_default_logger(g_logger);

        // Flush on error level and above
        g_logger->flush_on(spdlog::level::err);

        g_initialized.store(true, std::memory_order_release);

        LOG_DEBUG("Logging initialized (level={})", levelToString(config.level));
        if (!config.filePath.empty()) {
            LOG_DEBUG("Log file: {} (max {}MB x {} backups)", config.filePath,
                      config.maxFileSize / (1024 * 1024), config.maxBackups);
        }

        return true;
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        return false;
    }
}

bool initializeEarly() {
    LogConfig config;
    config.systemdOutput = runningUnderSystemd();
    return initialize(config);
}

void shutdown() {
    std::lock_guard<std::mutex> lock(g_init_mutex);

    if (g_logger) {
        g_logger->flush();
    }

    g_initialized.store(false, std::memory_order_release);
    spdlog::shutdown();
    g_logger.reset();
}

void setLevel(LogLevel level) {
    if (g_logger) {
        g_logger->set_level(toSpdlogLevel(level));
        for (auto& sink : g_logger->sinks()) {
            sink->set_level(toSpdlogLevel(level));
        }
    }
}

std::shared_ptr<spdlog::logger> getLogger() {
    // Fast path: already initialized (no lock)
    if (g_initialized.load(std::memory_order_acquire)) {
        return g_logger;
    }
    // Slow path: need initialization
    initializeEarly();
    return g_logger;
}

std::string_view levelToString(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "trace";
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Error:
        return "error";
    case LogLevel::Critical:
        return "critical";
    case LogLevel::Off:
        return "off";
    default:
        return "info";
    }
}

LogLevel stringToLevel(std::string_view str) {
    const std::string lower = toLower(str);

    if (lower == "trace")
        return LogLevel::Trace;
    if (lower == "debug")
        return LogLevel::Debug;
    if (lower == "info")
        return LogLevel::Info;
    if (lower == "warn" || lower == "warning")
        return LogLevel::Warn;
    if (lower == "error" || lower == "err")
        return LogLevel::Error;
    if (lower == "critical" || lower == "fatal")
        return LogLevel::Critical;
    if (lower == "off" || lower == "none")
        return LogLevel::Off;

    return LogLevel::Info;  // Default
}

bool isValidLevelName(std::string_view str) {
    const std::string lower = toLower(str);
    return lower == "trace" || lower == "debug" || lower == "info" || lower == "warn" ||
           lower == "warning" || lower == "error" || lower == "err" || lower == "critical" ||
           lower == "fatal" || lower == "off" || lower == "none";
}

int toSyslogPriority(LogLevel level) {
    switch (level) {
    case LogLevel::Critical:
    case LogLevel::Error:
        return 3;
    case LogLevel::Warn:
        return 4;
    case LogLevel::Info:
        return 6;
    case LogLevel::Debug:
    case LogLevel::Trace:
    default:
        return 7;
    }
}

bool runningUnderSystemd(const std::function<const char*(const char*)>& getenvFn) {
    return getenvFn(LauncherConstants::ENV_SYSTEMD_EXEC_PID) != nullptr &&
           isatty(STDERR_FILENO) == 0;
}

}  // namespace logging
}  // namespace mpd_launcher
