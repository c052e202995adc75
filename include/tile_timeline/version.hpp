// === Version Metadata ========================================================
//
// Exposes the builder's semantic version string used in logs and CLI output.

#pragma once

#include <string_view>

namespace tile_timeline {

inline constexpr std::string_view k_version{"0.3.0"};

}  // namespace tile_timeline
