#pragma once

/// @file version.hpp
/// @brief Library version of tactical_combat_core.

#define TCC_VERSION_MAJOR 1
#define TCC_VERSION_MINOR 0
#define TCC_VERSION_PATCH 0
#define TCC_VERSION_STRING "1.0.0"

namespace tcc {

struct Version {
    static constexpr int major = TCC_VERSION_MAJOR;
    static constexpr int minor = TCC_VERSION_MINOR;
    static constexpr int patch = TCC_VERSION_PATCH;
    static constexpr const char* string = TCC_VERSION_STRING;
};

} // namespace tcc
