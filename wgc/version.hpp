#pragma once

// =============================================================================
// FILE: wgc/version.hpp
// BRIEF: Library version
// =============================================================================

#define WGC_VERSION_MAJOR 0
#define WGC_VERSION_MINOR 3
#define WGC_VERSION_PATCH 1

#define WGC_VERSION_STRING "0.3.1"

namespace wgc {

inline constexpr const char* version_string() noexcept {
    return WGC_VERSION_STRING;
}

} // namespace wgc
