#pragma once

#define ANUMANA_VERSION "1.3.0"
#define ANUMANA_FORMAT_VERSION_MAJOR 1
#define ANUMANA_FORMAT_VERSION_MINOR 0

namespace anumana {
namespace version {

inline bool format_compatible(int major, int minor) {
    // Major version must match exactly (breaking changes)
    // Minor version: reader must be >= file (backward compatible additions)
    return major == ANUMANA_FORMAT_VERSION_MAJOR &&
           minor <= ANUMANA_FORMAT_VERSION_MINOR;
}

} // namespace version
} // namespace anumana
