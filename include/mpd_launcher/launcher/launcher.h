#pragma once

#include "mpd_launcher/core/config_loader.h"
#include "mpd_launcher/core/error_codes.h"
#include "mpd_launcher/launcher/launch_options.h"
#include "mpd_launcher/runtime/runtime_layout.h"

#include <optional>
#include <string>
#include <vector>

namespace mpd_launcher {
namespace launcher {

/**
 * @brief Prepares the runtime directory and hands the process over to mpd.
 *
 * Three steps, no retries:
 *   1. reset <root>/.mpd and <root>/.mpd/playlists
 *   2. write <root>/.mpd/mpd.conf
 *   3. exec <mpd> --no-daemon <root>/.mpd/mpd.conf [forwarded...]
 */
class Launcher {
   public:
    struct Settings {
        runtime::RuntimeLayout layout;
        std::string mpdBinary;
        std::vector<std::string> forwardedArgs;
    };

    explicit Launcher(Settings settings);

    // Steps 1 and 2. Stops at the first failure.
    std::optional<ErrorDetail> prepare() const;

    std::vector<std::string> daemonArgv() const;

    // All three steps. Returns only on failure; on success the process
    // image has been replaced.
    ErrorDetail run() const;

    const Settings& settings() const;

   private:
    Settings settings_;
};

// Environment override > config file > built-in default.
Launcher::Settings makeSettings(const LaunchOptions& options, const LauncherConfig& config);

}  // namespace launcher
}  // namespace mpd_launcher
