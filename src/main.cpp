#include "mpd_launcher/core/config_loader.h"
#include "mpd_launcher/core/error_codes.h"
#include "mpd_launcher/launcher/launch_options.h"
#include "mpd_launcher/launcher/launcher.h"
#include "mpd_launcher/logging/logger.h"

namespace {

int fail(const mpd_launcher::ErrorDetail& error) {
    LOG_ERROR("{} [{} {}]", error.describe(), mpd_launcher::errorCodeToString(error.code),
              mpd_launcher::errorCodeToHex(error.code));
    mpd_launcher::logging::shutdown();
    return mpd_launcher::toExitStatus(error.code);
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace mpd_launcher;

    // stderr only until mpd-launcher.json has been read
    logging::initializeEarly();

    auto parsed = launcher::parseLaunchOptions(argc, argv);
    if (parsed.hasError) {
        return fail(parsed.error);
    }
    const auto& options = *parsed.options;
    if (options.logLevel) {
        logging::setLevel(*options.logLevel);
    }

    LauncherConfig config;
    if (!loadLauncherConfig(options.configPath, config)) {
        LOG_DEBUG("Using built-in launcher defaults");
    }

    // Environment overrides mpd-launcher.json
    if (options.logLevel) {
        config.logging.level = *options.logLevel;
    }
    config.logging.systemdOutput = logging::runningUnderSystemd();
    if (!logging::initialize(config.logging)) {
        LOG_WARN("Cannot apply logging config, keeping stderr output");
    }

    LOG_DEBUG("Launcher root: {}", options.root.string());

    launcher::Launcher mpdLauncher(launcher::makeSettings(options, config));
    return fail(mpdLauncher.run());
}
