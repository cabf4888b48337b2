#include "mpd_launcher/runtime/mpd_config_writer.h"

#include "mpd_launcher/logging/logger.h"

#include <cerrno>
#include <fcntl.h>
#include <sstream>
#include <unistd.h>

namespace mpd_launcher {
namespace runtime {

namespace {

void appendSetting(std::ostringstream& out, const char* key,
                   const std::filesystem::path& value, bool commented = false) {
    if (commented) {
        out << "# ";
    }
    out << key << " \"" << value.string() << "\"\n";
}

ErrorDetail makeWriteError(const RuntimeLayout& layout, const char* operation, int err) {
    ErrorDetail error(ErrorCode::FS_CONFIG_WRITE_FAILED, "Cannot write mpd config");
    error.path = layout.configFile.string();
    error.operation = operation;
    error.sysErrno = err;
    return error;
}

}  // namespace

std::string renderMpdConfig(const RuntimeLayout& layout) {
    std::ostringstream out;
    appendSetting(out, "bind_to_address", layout.socketPath);
    appendSetting(out, "pid_file", layout.pidFile, true);
    appendSetting(out, "db_file", layout.dbFile);
    appendSetting(out, "state_file", layout.stateFile);
    appendSetting(out, "playlist_directory", layout.playlistDir);
    appendSetting(out, "music_directory", layout.musicDir);
    return out.str();
}

std::optional<ErrorDetail> writeMpdConfig(const RuntimeLayout& layout) {
    const std::string content = renderMpdConfig(layout);

    int fd = open(layout.configFile.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return makeWriteError(layout, "open", errno);
    }

    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int err = errno;
            close(fd);
            return makeWriteError(layout, "write", err);
        }
        written += static_cast<size_t>(n);
    }

    if (close(fd) < 0) {
        return makeWriteError(layout, "close", errno);
    }

    LOG_DEBUG("Wrote {} ({} bytes)", layout.configFile.string(), content.size());
    return std::nullopt;
}

}  // namespace runtime
}  // namespace mpd_launcher
