#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define CALLGUARD_VERSION_MAJOR 0
#define CALLGUARD_VERSION_MINOR 1
#define CALLGUARD_VERSION_PATCH 0
#define CALLGUARD_VERSION_STRING "0.1.0"

namespace callguard {

/// Project version information at compile time.
struct Version {
    static constexpr int major = CALLGUARD_VERSION_MAJOR;
    static constexpr int minor = CALLGUARD_VERSION_MINOR;
    static constexpr int patch = CALLGUARD_VERSION_PATCH;
    static constexpr const char* string = CALLGUARD_VERSION_STRING;
};

} // namespace callguard
