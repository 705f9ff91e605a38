#pragma once

#define TETHER_VERSION "1.4.0"
#define TETHER_FORMAT_VERSION_MAJOR 1
#define TETHER_FORMAT_VERSION_MINOR 0

namespace tether {
namespace version {

inline bool format_compatible(int major, int minor) {
    // Major version must match exactly (document layout changes)
    // Minor version: reader must be >= writer (new optional fields)
    return major == TETHER_FORMAT_VERSION_MAJOR &&
           minor <= TETHER_FORMAT_VERSION_MINOR;
}

} // namespace version
} // namespace tether
