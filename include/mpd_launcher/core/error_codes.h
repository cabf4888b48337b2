#ifndef MPD_LAUNCHER_ERROR_CODES_H
#define MPD_LAUNCHER_ERROR_CODES_H

#include <cstdint>
#include <optional>
#include <string>

namespace mpd_launcher {

/**
 * @brief Error codes for the launcher.
 *
 * Categories use upper 4 bits of the low 16 bits (0xF000 mask):
 * - 0x1xxx: Filesystem (runtime directory, mpd.conf)
 * - 0x2xxx: Exec (daemon handoff)
 * - 0x5xxx: Validation (inputs, launcher config)
 */
enum class ErrorCode : uint32_t {
    OK = 0,

    // Filesystem (0x1000)
    FS_RUNTIME_DIR_REMOVE_FAILED = 0x1001,
    FS_RUNTIME_DIR_CREATE_FAILED = 0x1002,
    FS_CONFIG_WRITE_FAILED = 0x1003,

    // Exec (0x2000)
    EXEC_DAEMON_NOT_FOUND = 0x2001,
    EXEC_FAILED = 0x2002,

    // Validation (0x5000)
    VALIDATION_INVALID_CONFIG = 0x5001,
    VALIDATION_HOME_NOT_FOUND = 0x5002,
    VALIDATION_ROOT_NOT_FOUND = 0x5003,
    VALIDATION_INVALID_LOG_LEVEL = 0x5004,
};

/**
 * @brief Error details from a failed launcher step.
 *
 * Carries the system error that caused the failure so it can be surfaced
 * unchanged to the caller.
 */
struct ErrorDetail {
    ErrorCode code = ErrorCode::OK;
    std::string message;               // What the launcher was doing
    std::string path;                  // Path involved, if any
    std::optional<int> sysErrno;       // errno / std::error_code value
    std::optional<std::string> operation;  // Failed call (e.g. "execvp")

    ErrorDetail() = default;

    // Convenience constructor for simple errors
    ErrorDetail(ErrorCode code, const std::string& message);

    /**
     * @brief Single-line description including the system error text.
     *
     * Example: "Cannot create runtime directory: /opt/app/.mpd/playlists
     * (create_directories: Permission denied)"
     */
    std::string describe() const;
};

/**
 * @brief Convert ErrorCode to string representation.
 * @param code The error code
 * @return String name (e.g., "EXEC_FAILED"), or "UNKNOWN_ERROR" for unknown codes
 */
const char* errorCodeToString(ErrorCode code);

/**
 * @brief Convert ErrorCode to a process exit status.
 *
 * Follows the POSIX shell convention so callers observe the same status a
 * shell script would report: 127 when the daemon is not found, 126 when it
 * cannot be executed, 1 for any other failure.
 *
 * @param code The error code
 * @return Exit status (0 only for OK)
 */
int toExitStatus(ErrorCode code);

/**
 * @brief Convert ErrorCode to hex string.
 * @param code The error code
 * @return Hex string (e.g., "0x2001")
 */
std::string errorCodeToHex(ErrorCode code);

}  // namespace mpd_launcher

#endif  // MPD_LAUNCHER_ERROR_CODES_H
