#pragma once

#include "mpd_launcher/core/error_codes.h"

#include <string>
#include <vector>

namespace mpd_launcher {
namespace exec {

/**
 * @brief Build the daemon command line.
 *
 * Result: [binary, "--no-daemon", configFile, forwarded...]
 */
std::vector<std::string> buildDaemonArgv(const std::string& binary,
                                         const std::string& configFile,
                                         const std::vector<std::string>& forwarded);

/**
 * @brief Replace the current process image with args[0].
 *
 * Bare names are searched in PATH (execvp). Shuts the logger down first so
 * mpd inherits no log file descriptor; later LOG_* calls re-create a stderr
 * logger.
 * Returns only when the exec fails; ENOENT is reported as
 * EXEC_DAEMON_NOT_FOUND, everything else as EXEC_FAILED.
 */
ErrorDetail execDaemon(const std::vector<std::string>& args);

}  // namespace exec
}  // namespace mpd_launcher
