#pragma once

#include "mpd_launcher/core/error_codes.h"
#include "mpd_launcher/logging/logger.h"

#include <cstdlib>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace mpd_launcher {
namespace launcher {

struct LaunchOptions {
    std::filesystem::path root;        // Anchor of the runtime directory
    std::filesystem::path home;        // Source of <home>/Music
    std::filesystem::path configPath;  // mpd-launcher.json (may not exist)
    std::optional<std::string> mpdBinary;         // MPD_LAUNCHER_MPD override
    std::optional<logging::LogLevel> logLevel;    // MPD_LAUNCHER_LOG_LEVEL override
    std::vector<std::string> forwardedArgs;       // argv[1..], verbatim
};

struct ParseOptionsResult {
    std::optional<LaunchOptions> options;
    bool hasError{false};
    ErrorDetail error;
};

// Process-level lookups, replaceable in tests.
struct LaunchEnvironment {
    std::function<const char*(const char*)> getenvFn = ::getenv;
    std::function<std::optional<std::filesystem::path>()> executableDirFn;
    std::function<std::optional<std::filesystem::path>()> passwdHomeFn;

    LaunchEnvironment();
};

// Directory containing the running executable (/proc/self/exe).
std::optional<std::filesystem::path> executableDirectory();

// Home directory from the passwd entry of the real user id.
std::optional<std::filesystem::path> passwdHomeDirectory();

/**
 * @brief Collect launcher inputs.
 *
 * Every command-line argument after argv[0] is forwarded to mpd untouched;
 * the launcher is configured through the environment only.
 */
ParseOptionsResult parseLaunchOptions(int argc, char** argv,
                                      const LaunchEnvironment& env = LaunchEnvironment{});

}  // namespace launcher
}  // namespace mpd_launcher
