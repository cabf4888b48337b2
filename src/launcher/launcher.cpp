#include "mpd_launcher/launcher/launcher.h"

#include "mpd_launcher/exec/daemon_exec.h"
#include "mpd_launcher/logging/logger.h"
#include "mpd_launcher/runtime/mpd_config_writer.h"
#include "mpd_launcher/runtime/runtime_dir.h"

#include <utility>

namespace mpd_launcher {
namespace launcher {

Launcher::Launcher(Settings settings) : settings_(std::move(settings)) {}

std::optional<ErrorDetail> Launcher::prepare() const {
    const auto& layout = settings_.layout;

    if (auto error = runtime::resetRuntimeDir(layout)) {
        return error;
    }
    if (auto error = runtime::writeMpdConfig(layout)) {
        return error;
    }

    LOG_INFO("mpd config: {}", layout.configFile.string());
    LOG_INFO("Clients can connect with MPD_SOCKET={}", layout.socketPath.string());
    return std::nullopt;
}

std::vector<std::string> Launcher::daemonArgv() const {
    return exec::buildDaemonArgv(settings_.mpdBinary, settings_.layout.configFile.string(),
                                 settings_.forwardedArgs);
}

ErrorDetail Launcher::run() const {
    if (auto error = prepare()) {
        return *error;
    }
    return exec::execDaemon(daemonArgv());
}

const Launcher::Settings& Launcher::settings() const {
    return settings_;
}

Launcher::Settings makeSettings(const LaunchOptions& options, const LauncherConfig& config) {
    Launcher::Settings settings;
    settings.layout = runtime::RuntimeLayout::make(options.root, options.home);
    settings.mpdBinary = options.mpdBinary ? *options.mpdBinary : config.mpdBinary;
    settings.forwardedArgs = options.forwardedArgs;
    return settings;
}

}  // namespace launcher
}  // namespace mpd_launcher
