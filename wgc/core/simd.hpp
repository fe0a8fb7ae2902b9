#pragma once

#include "wgc/core/type.hpp"

// =============================================================================
// FILE: wgc/core/simd.hpp
// BRIEF: Google Highway ops for the build's static target
// =============================================================================
//
// Only the statically selected target is compiled (no runtime dispatch).
// Configure with -DWGC_ONLY_SCALAR to force the scalar fallback.
// =============================================================================

#if defined(WGC_ONLY_SCALAR) && !defined(HWY_COMPILE_ONLY_SCALAR)
    #define HWY_COMPILE_ONLY_SCALAR
#endif

#include <hwy/highway.h>

namespace wgc::simd {

using namespace hwy::HWY_NAMESPACE;

// Full-width vector of sketch registers
using ByteTag = ScalableTag<Byte>;

} // namespace wgc::simd
