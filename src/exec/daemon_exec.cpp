#include "mpd_launcher/exec/daemon_exec.h"

#include "mpd_launcher/core/launcher_constants.h"
#include "mpd_launcher/logging/logger.h"

#include <cerrno>
#include <unistd.h>

namespace mpd_launcher {
namespace exec {

namespace {

std::string joinForLog(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& arg : args) {
        if (!out.empty()) {
            out += ' ';
        }
        out += arg;
    }
    return out;
}

}  // namespace

std::vector<std::string> buildDaemonArgv(const std::string& binary,
                                         const std::string& configFile,
                                         const std::vector<std::string>& forwarded) {
    std::vector<std::string> args;
    args.reserve(forwarded.size() + 3);
    args.push_back(binary);
    args.emplace_back(LauncherConstants::NO_DAEMON_FLAG);
    args.push_back(configFile);
    args.insert(args.end(), forwarded.begin(), forwarded.end());
    return args;
}

ErrorDetail execDaemon(const std::vector<std::string>& args) {
    if (args.empty() || args.front().empty()) {
        ErrorDetail error(ErrorCode::EXEC_DAEMON_NOT_FOUND, "No daemon binary configured");
        error.sysErrno = ENOENT;
        return error;
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    LOG_INFO("Starting {}", joinForLog(args));
    // Closes the log file too; spdlog does not open it with O_CLOEXEC
    logging::shutdown();

    execvp(argv[0], argv.data());

    // Only reached when execvp failed
    const int err = errno;
    ErrorDetail error(err == ENOENT ? ErrorCode::EXEC_DAEMON_NOT_FOUND : ErrorCode::EXEC_FAILED,
                      "Cannot start daemon");
    error.path = args.front();
    error.operation = "execvp";
    error.sysErrno = err;
    return error;
}

}  // namespace exec
}  // namespace mpd_launcher
