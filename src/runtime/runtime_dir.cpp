#include "mpd_launcher/runtime/runtime_dir.h"

#include "mpd_launcher/logging/logger.h"

#include <filesystem>
#include <system_error>

namespace mpd_launcher {
namespace runtime {

namespace {

ErrorDetail makeFsError(ErrorCode code, const std::string& message,
                        const std::filesystem::path& path, const char* operation,
                        const std::error_code& ec) {
    ErrorDetail error(code, message);
    error.path = path.string();
    error.operation = operation;
    error.sysErrno = ec.value();
    return error;
}

}  // namespace

std::optional<ErrorDetail> resetRuntimeDir(const RuntimeLayout& layout) {
    std::error_code ec;

    const auto removed = std::filesystem::remove_all(layout.runtimeDir, ec);
    if (ec) {
        return makeFsError(ErrorCode::FS_RUNTIME_DIR_REMOVE_FAILED,
                           "Cannot remove runtime directory", layout.runtimeDir, "remove_all",
                           ec);
    }
    if (removed > 0) {
        LOG_DEBUG("Removed {} entries under {}", removed, layout.runtimeDir.string());
    }

    // create_directories also creates runtimeDir and any missing parents
    std::filesystem::create_directories(layout.playlistDir, ec);
    if (ec) {
        return makeFsError(ErrorCode::FS_RUNTIME_DIR_CREATE_FAILED,
                           "Cannot create runtime directory", layout.playlistDir,
                           "create_directories", ec);
    }

    LOG_DEBUG("Runtime directory ready: {}", layout.runtimeDir.string());
    return std::nullopt;
}

}  // namespace runtime
}  // namespace mpd_launcher
