#pragma once

#include "mpd_launcher/core/error_codes.h"
#include "mpd_launcher/runtime/runtime_layout.h"

#include <optional>
#include <string>

namespace mpd_launcher {
namespace runtime {

// Text of mpd.conf for a layout. Values are quoted but not escaped, and the
// output carries nothing time-dependent.
std::string renderMpdConfig(const RuntimeLayout& layout);

// Writes renderMpdConfig(layout) to layout.configFile, replacing old content.
std::optional<ErrorDetail> writeMpdConfig(const RuntimeLayout& layout);

}  // namespace runtime
}  // namespace mpd_launcher
