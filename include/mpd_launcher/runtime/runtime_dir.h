#pragma once

#include "mpd_launcher/core/error_codes.h"
#include "mpd_launcher/runtime/runtime_layout.h"

#include <optional>

namespace mpd_launcher {
namespace runtime {

/**
 * @brief Destroy and recreate the runtime directory.
 *
 * Removes layout.runtimeDir recursively (absent is not an error), then
 * creates it together with layout.playlistDir and any missing parents.
 * Nothing is rolled back on failure.
 *
 * @return std::nullopt on success, the failed step otherwise
 */
std::optional<ErrorDetail> resetRuntimeDir(const RuntimeLayout& layout);

}  // namespace runtime
}  // namespace mpd_launcher
