#include "mpd_launcher/core/config_loader.h"

#include "mpd_launcher/core/error_codes.h"
#include "mpd_launcher/core/launcher_constants.h"

#include <fstream>
#include <nlohmann/json.hpp>

namespace mpd_launcher {

static void loadLoggingSection(const nlohmann::json& section, logging::LogConfig& config,
                               bool verbose) {
    if (section.contains("level") && section["level"].is_string()) {
        const auto level = section["level"].get<std::string>();
        if (!logging::isValidLevelName(level) && verbose) {
            LOG_WARN("Config: Unknown logging.level '{}', using 'info'", level);
        }
        config.level = logging::stringToLevel(level);
    }
    if (section.contains("filePath")) {
        config.filePath = section["filePath"].get<std::string>();
    }
    if (section.contains("maxFileSize")) {
        config.maxFileSize = section["maxFileSize"].get<size_t>();
    }
    if (section.contains("maxBackups")) {
        config.maxBackups = section["maxBackups"].get<size_t>();
    }
    if (section.contains("consoleOutput")) {
        config.consoleOutput = section["consoleOutput"].get<bool>();
    }
    if (section.contains("coloredOutput")) {
        config.coloredOutput = section["coloredOutput"].get<bool>();
    }
    if (section.contains("pattern")) {
        config.pattern = section["pattern"].get<std::string>();
    }
}

bool loadLauncherConfig(const std::filesystem::path& configPath, LauncherConfig& outConfig,
                        bool verbose) {
    outConfig = LauncherConfig{};

    std::ifstream file(configPath);
    if (!file.is_open()) {
        if (verbose) {
            LOG_DEBUG("Config: {} not found, using defaults", configPath.string());
        }
        return false;
    }

    try {
        nlohmann::json j;
        file >> j;

        if (!j.is_object()) {
            if (verbose) {
                LOG_ERROR("Config: {} must contain a JSON object, using defaults [{}]",
                          configPath.string(),
                          errorCodeToString(ErrorCode::VALIDATION_INVALID_CONFIG));
            }
            return false;
        }

        if (j.contains("mpdBinary")) {
            const auto binary = j["mpdBinary"].get<std::string>();
            if (binary.empty()) {
                if (verbose) {
                    LOG_WARN("Config: Empty mpdBinary, using '{}'",
                             LauncherConstants::DEFAULT_MPD_BINARY);
                }
            } else {
                outConfig.mpdBinary = binary;
            }
        }

        if (j.contains("logging") && j["logging"].is_object()) {
            loadLoggingSection(j["logging"], outConfig.logging, verbose);
        }

        if (verbose) {
            LOG_DEBUG("Config: Loaded from {}", std::filesystem::absolute(configPath).string());
        }
        return true;
    } catch (const std::exception& e) {
        if (verbose) {
            LOG_ERROR("Config: Failed to parse {}: {} [{}]", configPath.string(), e.what(),
                      errorCodeToString(ErrorCode::VALIDATION_INVALID_CONFIG));
        }
        outConfig = LauncherConfig{};
        return false;
    }
}

}  // namespace mpd_launcher
