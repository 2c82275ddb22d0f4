#pragma once

/// @file version.hpp
/// @brief Library version information.

#define TRIPWIRE_VERSION_MAJOR 0
#define TRIPWIRE_VERSION_MINOR 1
#define TRIPWIRE_VERSION_PATCH 0
#define TRIPWIRE_VERSION_STRING "0.1.0"

namespace tripwire {

/// Library version at compile time.
struct Version {
    static constexpr int major = TRIPWIRE_VERSION_MAJOR;
    static constexpr int minor = TRIPWIRE_VERSION_MINOR;
    static constexpr int patch = TRIPWIRE_VERSION_PATCH;
    static constexpr const char* string = TRIPWIRE_VERSION_STRING;
};

}  // namespace tripwire
