#include "mpd_launcher/launcher/launch_options.h"

#include "mpd_launcher/core/launcher_constants.h"

#include <pwd.h>
#include <system_error>
#include <unistd.h>

namespace mpd_launcher {
namespace launcher {

namespace {

bool isSet(const char* value) {
    return value != nullptr && *value != '\0';
}

// An empty HOME counts as unset
std::optional<std::filesystem::path> resolveHome(const LaunchEnvironment& env) {
    if (const char* home = env.getenvFn(LauncherConstants::ENV_HOME); isSet(home)) {
        return std::filesystem::path(home);
    }
    if (env.passwdHomeFn) {
        return env.passwdHomeFn();
    }
    return std::nullopt;
}

std::optional<std::filesystem::path> resolveRoot(const LaunchEnvironment& env) {
    if (const char* root = env.getenvFn(LauncherConstants::ENV_ROOT); isSet(root)) {
        std::error_code ec;
        auto absolute = std::filesystem::absolute(root, ec);
        if (ec) {
            return std::nullopt;
        }
        return absolute;
    }
    if (env.executableDirFn) {
        return env.executableDirFn();
    }
    return std::nullopt;
}

}  // namespace

LaunchEnvironment::LaunchEnvironment()
    : executableDirFn(executableDirectory), passwdHomeFn(passwdHomeDirectory) {}

std::optional<std::filesystem::path> executableDirectory() {
    std::error_code ec;
    auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec || exe.empty()) {
        return std::nullopt;
    }
    return exe.parent_path();
}

std::optional<std::filesystem::path> passwdHomeDirectory() {
    const passwd* entry = getpwuid(getuid());
    if (entry == nullptr || !isSet(entry->pw_dir)) {
        return std::nullopt;
    }
    return std::filesystem::path(entry->pw_dir);
}

ParseOptionsResult parseLaunchOptions(int argc, char** argv, const LaunchEnvironment& env) {
    LaunchOptions opt{};
    ParseOptionsResult result{};

    auto fail = [&](ErrorCode code, const std::string& message) {
        result.hasError = true;
        result.error = ErrorDetail(code, message);
        return result;
    };

    auto home = resolveHome(env);
    if (!home || home->empty()) {
        return fail(ErrorCode::VALIDATION_HOME_NOT_FOUND,
                    "HOME is not set and no passwd entry provides a home directory");
    }
    opt.home = *home;

    auto root = resolveRoot(env);
    if (!root || root->empty()) {
        return fail(ErrorCode::VALIDATION_ROOT_NOT_FOUND,
                    "Cannot determine launcher root (set MPD_LAUNCHER_ROOT)");
    }
    opt.root = *root;

    if (const char* config = env.getenvFn(LauncherConstants::ENV_CONFIG); isSet(config)) {
        opt.configPath = config;
    } else {
        opt.configPath = opt.root / LauncherConstants::DEFAULT_CONFIG_FILE;
    }

    if (const char* binary = env.getenvFn(LauncherConstants::ENV_MPD_BINARY); isSet(binary)) {
        opt.mpdBinary = std::string(binary);
    }

    if (const char* level = env.getenvFn(LauncherConstants::ENV_LOG_LEVEL); isSet(level)) {
        if (!logging::isValidLevelName(level)) {
            return fail(ErrorCode::VALIDATION_INVALID_LOG_LEVEL,
                        std::string("Unsupported MPD_LAUNCHER_LOG_LEVEL '") + level +
                            "'. Use one of: trace|debug|info|warn|error|critical|off");
        }
        opt.logLevel = logging::stringToLevel(level);
    }

    for (int i = 1; i < argc; ++i) {
        opt.forwardedArgs.emplace_back(argv[i]);
    }

    result.options = opt;
    return result;
}

}  // namespace launcher
}  // namespace mpd_launcher
