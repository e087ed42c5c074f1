#pragma once

/// @file version.hpp
/// @brief Library version information and core namespace definition.

#define CBREAK_VERSION_MAJOR 0
#define CBREAK_VERSION_MINOR 1
#define CBREAK_VERSION_PATCH 0
#define CBREAK_VERSION_STRING "0.1.0"

namespace cbreak {

/// Library version information at compile time.
struct Version {
    static constexpr int major = CBREAK_VERSION_MAJOR;
    static constexpr int minor = CBREAK_VERSION_MINOR;
    static constexpr int patch = CBREAK_VERSION_PATCH;
    static constexpr const char* string = CBREAK_VERSION_STRING;
};

} // namespace cbreak
