#pragma once

#include <filesystem>

namespace mpd_launcher {
namespace runtime {

/**
 * @brief Every path the launcher touches or hands to mpd.
 *
 * All paths except musicDir live under runtimeDir.
 */
struct RuntimeLayout {
    std::filesystem::path root;
    std::filesystem::path runtimeDir;   // <root>/.mpd
    std::filesystem::path configFile;   // <runtimeDir>/mpd.conf
    std::filesystem::path socketPath;   // <runtimeDir>/mpd.sock
    std::filesystem::path pidFile;      // <runtimeDir>/mpd.pid (commented out in mpd.conf)
    std::filesystem::path dbFile;       // <runtimeDir>/mpd.db
    std::filesystem::path stateFile;    // <runtimeDir>/mpdstate
    std::filesystem::path playlistDir;  // <runtimeDir>/playlists
    std::filesystem::path musicDir;     // <home>/Music, not validated

    static RuntimeLayout make(const std::filesystem::path& root,
                              const std::filesystem::path& home);
};

}  // namespace runtime
}  // namespace mpd_launcher
