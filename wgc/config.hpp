#pragma once

#include <cstddef>
#include <cstdint>

// =============================================================================
// FILE: wgc/config.hpp
// BRIEF: Compile-time configuration: threading backend and tunables
// =============================================================================

// -----------------------------------------------------------------------------
// Threading backend
// -----------------------------------------------------------------------------
//
// The build passes exactly one of WGC_BACKEND_OPENMP, WGC_BACKEND_TBB or
// WGC_BACKEND_SERIAL. A bare include (tools, IDE indexing) falls back to
// OpenMP when the compiler was invoked with -fopenmp and to serial otherwise.

#if !defined(WGC_BACKEND_OPENMP) && !defined(WGC_BACKEND_TBB) && !defined(WGC_BACKEND_SERIAL)
    #if defined(_OPENMP)
        #define WGC_BACKEND_OPENMP
    #else
        #define WGC_BACKEND_SERIAL
    #endif
#endif

#if defined(WGC_BACKEND_OPENMP) + defined(WGC_BACKEND_TBB) + defined(WGC_BACKEND_SERIAL) != 1
    #error "wgc: define exactly one of WGC_BACKEND_OPENMP, WGC_BACKEND_TBB, WGC_BACKEND_SERIAL"
#endif

#if defined(WGC_BACKEND_OPENMP)
    #define WGC_USE_OPENMP 1
#elif defined(WGC_BACKEND_TBB)
    #define WGC_USE_TBB 1
#else
    #define WGC_USE_SERIAL 1
#endif

// -----------------------------------------------------------------------------
// Memory
// -----------------------------------------------------------------------------

namespace wgc::memory {
    inline constexpr std::size_t DEFAULT_ALIGNMENT = 64;
}

// =============================================================================
// Graph Store Configuration
// =============================================================================

namespace wgc::graph::config {
    // Edges held in memory before a sorted run is spilled to disk
    inline constexpr std::size_t DEFAULT_MAX_BUFFERED_EDGES = std::size_t(1) << 24;
    // Edges read per refill when merging spilled runs
    inline constexpr std::size_t RUN_READ_BATCH = 4096;
    inline constexpr std::uint32_t FORMAT_VERSION = 1;
}

// =============================================================================
// Sketch Configuration
// =============================================================================

namespace wgc::sketch::config {
    inline constexpr int MIN_PRECISION = 4;
    inline constexpr int MAX_PRECISION = 16;
    inline constexpr int DEFAULT_PRECISION = 10;
    inline constexpr std::uint64_t DEFAULT_SEED = 0x5851f42d4c957f2dULL;
}

// =============================================================================
// Engine Configuration
// =============================================================================

namespace wgc::engine::config {
    inline constexpr std::uint32_t DEFAULT_MAX_ROUNDS = 64;
    inline constexpr double DEFAULT_CONVERGENCE_FRACTION = 1e-4;
    inline constexpr std::size_t DEFAULT_KEEP_CHECKPOINTS = 2;
    inline constexpr std::int32_t CHECKPOINT_FORMAT_VERSION = 1;
}
