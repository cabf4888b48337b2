#ifndef MPD_LAUNCHER_LAUNCHER_CONSTANTS_H
#define MPD_LAUNCHER_LAUNCHER_CONSTANTS_H

// Names shared by the runtime layout, the config writer and the exec step

namespace LauncherConstants {

// Runtime directory layout (relative to the launcher root)
constexpr const char* RUNTIME_DIR_NAME = ".mpd";
constexpr const char* MPD_CONFIG_FILE_NAME = "mpd.conf";
constexpr const char* SOCKET_FILE_NAME = "mpd.sock";
constexpr const char* PID_FILE_NAME = "mpd.pid";
constexpr const char* DB_FILE_NAME = "mpd.db";
constexpr const char* STATE_FILE_NAME = "mpdstate";
constexpr const char* PLAYLIST_DIR_NAME = "playlists";

// Music source (relative to the home directory)
constexpr const char* MUSIC_DIR_NAME = "Music";

// Daemon invocation
constexpr const char* DEFAULT_MPD_BINARY = "mpd";
constexpr const char* NO_DAEMON_FLAG = "--no-daemon";

// Launcher configuration file (relative to the launcher root)
constexpr const char* DEFAULT_CONFIG_FILE = "mpd-launcher.json";

// Environment variables
constexpr const char* ENV_HOME = "HOME";
constexpr const char* ENV_ROOT = "MPD_LAUNCHER_ROOT";
constexpr const char* ENV_CONFIG = "MPD_LAUNCHER_CONFIG";
constexpr const char* ENV_MPD_BINARY = "MPD_LAUNCHER_MPD";
constexpr const char* ENV_LOG_LEVEL = "MPD_LAUNCHER_LOG_LEVEL";
constexpr const char* ENV_SYSTEMD_EXEC_PID = "SYSTEMD_EXEC_PID";

}  // namespace LauncherConstants

#endif  // MPD_LAUNCHER_LAUNCHER_CONSTANTS_H
