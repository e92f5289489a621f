// === Version Metadata ========================================================
//
// Exposes the simulator's semantic version string used in logs and the
// `Server` response header.

#pragma once

#include <string_view>

namespace uav_mock {

inline constexpr std::string_view k_version{"1.0.0"};

}  // namespace uav_mock
