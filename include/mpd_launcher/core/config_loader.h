#ifndef MPD_LAUNCHER_CONFIG_LOADER_H
#define MPD_LAUNCHER_CONFIG_LOADER_H

#include "mpd_launcher/logging/logger.h"

#include <filesystem>
#include <string>

namespace mpd_launcher {

// Launcher settings read from mpd-launcher.json. The generated mpd.conf is
// never affected by this file.
struct LauncherConfig {
    std::string mpdBinary = "mpd";  // Bare names are resolved through PATH
    logging::LogConfig logging;
};

// Reads configPath into outConfig. Returns false (with defaults in outConfig)
// when the file is missing or cannot be parsed.
bool loadLauncherConfig(const std::filesystem::path& configPath, LauncherConfig& outConfig,
                        bool verbose = true);

}  // namespace mpd_launcher

#endif  // MPD_LAUNCHER_CONFIG_LOADER_H
