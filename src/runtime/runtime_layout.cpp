#include "mpd_launcher/runtime/runtime_layout.h"

#include "mpd_launcher/core/launcher_constants.h"

namespace mpd_launcher {
namespace runtime {

RuntimeLayout RuntimeLayout::make(const std::filesystem::path& root,
                                  const std::filesystem::path& home) {
    RuntimeLayout layout;
    layout.root = root;
    layout.runtimeDir = root / LauncherConstants::RUNTIME_DIR_NAME;
    layout.configFile = layout.runtimeDir / LauncherConstants::MPD_CONFIG_FILE_NAME;
    layout.socketPath = layout.runtimeDir / LauncherConstants::SOCKET_FILE_NAME;
    layout.pidFile = layout.runtimeDir / LauncherConstants::PID_FILE_NAME;
    layout.dbFile = layout.runtimeDir / LauncherConstants::DB_FILE_NAME;
    layout.stateFile = layout.runtimeDir / LauncherConstants::STATE_FILE_NAME;
    layout.playlistDir = layout.runtimeDir / LauncherConstants::PLAYLIST_DIR_NAME;
    layout.musicDir = home / LauncherConstants::MUSIC_DIR_NAME;
    return layout;
}

}  // namespace runtime
}  // namespace mpd_launcher
