#pragma once

#include "wgc/config.hpp"

// =============================================================================
// FILE: wgc/core/macros.hpp
// BRIEF: Compiler hints and attributes used across the library
// =============================================================================

#if !(defined(__linux__) || defined(__APPLE__) || defined(__unix__))
    #error "wgc needs a POSIX system: snapshots are mmap'ed and publishes rely on rename(2)"
#endif

// -----------------------------------------------------------------------------
// Branch hints
// -----------------------------------------------------------------------------

#if defined(__GNUC__) || defined(__clang__)
    #define WGC_LIKELY(cond)   (__builtin_expect(!!(cond), 1))
    #define WGC_UNLIKELY(cond) (__builtin_expect(!!(cond), 0))
#else
    #define WGC_LIKELY(cond)   (cond)
    #define WGC_UNLIKELY(cond) (cond)
#endif

// -----------------------------------------------------------------------------
// Inlining, aliasing, symbol export
// -----------------------------------------------------------------------------

#define WGC_NODISCARD [[nodiscard]]

#if defined(__GNUC__) || defined(__clang__)
    #define WGC_FORCE_INLINE inline __attribute__((always_inline))
    #define WGC_RESTRICT     __restrict__
    #define WGC_EXPORT       __attribute__((visibility("default")))
#else
    #define WGC_FORCE_INLINE inline
    #define WGC_RESTRICT
    #define WGC_EXPORT
#endif

// -----------------------------------------------------------------------------
// Cache lines
// -----------------------------------------------------------------------------

// Per-thread slots are padded to this so neighbouring workers never share a line
#define WGC_CACHE_LINE_SIZE 64
#define WGC_ALIGNMENT       WGC_CACHE_LINE_SIZE

// locality: 0 (stream) .. 3 (keep in all levels)
#if defined(__GNUC__) || defined(__clang__)
    #define WGC_PREFETCH_READ(addr, locality) __builtin_prefetch((addr), 0, (locality))
#else
    #define WGC_PREFETCH_READ(addr, locality) ((void)(addr))
#endif
