#include "mpd_launcher/core/error_codes.h"

#include <cstring>
#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace mpd_launcher {

// Error code to string mapping
static const std::unordered_map<ErrorCode, const char*> kErrorCodeStrings = {
    {ErrorCode::OK, "OK"},

    // Filesystem
    {ErrorCode::FS_RUNTIME_DIR_REMOVE_FAILED, "FS_RUNTIME_DIR_REMOVE_FAILED"},
    {ErrorCode::FS_RUNTIME_DIR_CREATE_FAILED, "FS_RUNTIME_DIR_CREATE_FAILED"},
    {ErrorCode::FS_CONFIG_WRITE_FAILED, "FS_CONFIG_WRITE_FAILED"},

    // Exec
    {ErrorCode::EXEC_DAEMON_NOT_FOUND, "EXEC_DAEMON_NOT_FOUND"},
    {ErrorCode::EXEC_FAILED, "EXEC_FAILED"},

    // Validation
    {ErrorCode::VALIDATION_INVALID_CONFIG, "VALIDATION_INVALID_CONFIG"},
    {ErrorCode::VALIDATION_HOME_NOT_FOUND, "VALIDATION_HOME_NOT_FOUND"},
    {ErrorCode::VALIDATION_ROOT_NOT_FOUND, "VALIDATION_ROOT_NOT_FOUND"},
    {ErrorCode::VALIDATION_INVALID_LOG_LEVEL, "VALIDATION_INVALID_LOG_LEVEL"},
};

// Error code to exit status mapping (shell conventions)
static const std::unordered_map<ErrorCode, int> kExitStatusMap = {
    {ErrorCode::OK, 0},

    {ErrorCode::EXEC_DAEMON_NOT_FOUND, 127},
    {ErrorCode::EXEC_FAILED, 126},
};

ErrorDetail::ErrorDetail(ErrorCode code, const std::string& message)
    : code(code), message(message) {}

std::string ErrorDetail::describe() const {
    std::string out = message;
    if (!path.empty()) {
        out += ": " + path;
    }
    if (operation || sysErrno) {
        out += " (";
        if (operation) {
            out += *operation;
            if (sysErrno) {
                out += ": ";
            }
        }
        if (sysErrno) {
            out += std::strerror(*sysErrno);
        }
        out += ")";
    }
    return out;
}

const char* errorCodeToString(ErrorCode code) {
    auto it = kErrorCodeStrings.find(code);
    if (it != kErrorCodeStrings.end()) {
        return it->second;
    }
    return "UNKNOWN_ERROR";
}

int toExitStatus(ErrorCode code) {
    auto it = kExitStatusMap.find(code);
    if (it != kExitStatusMap.end()) {
        return it->second;
    }
    return 1;
}

std::string errorCodeToHex(ErrorCode code) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setfill('0') << std::setw(4) << static_cast<uint32_t>(code);
    return oss.str();
}

}  // namespace mpd_launcher
