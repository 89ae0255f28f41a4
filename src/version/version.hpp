#pragma once

#include <string_view>

#ifndef CAKELAUNCH_VERSION
#define CAKELAUNCH_VERSION "0.0.0"
#endif

namespace version {
inline constexpr std::string_view kName = "cakelaunch";
inline constexpr std::string_view kVersion = CAKELAUNCH_VERSION;
} // namespace version
