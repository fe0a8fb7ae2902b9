#pragma once

#include "wgc/config.hpp"
#include "wgc/core/type.hpp"
#include "wgc/core/error.hpp"
#include "wgc/core/macros.hpp"
#include "wgc/core/simd.hpp"

#include <bit>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <limits>

// =============================================================================
// FILE: wgc/sketch/hyperloglog.hpp
// BRIEF: HyperLogLog register arrays: insert, merge, estimate
// =============================================================================
//
// A sketch is a plain array of m = 2^p one-byte registers owned by the
// caller (the registry keeps all of them in one arena). Register j holds the
// largest rank seen among hashes routed to j, where the rank of the
// remaining q = 64 - p bits is their leading-zero count plus one (q + 1 if
// all are zero).
//
// Cardinality uses Ertl's improved raw estimator ("New cardinality
// estimation algorithms for HyperLogLog sketches", 2017). It needs no bias
// tables or range switches and is non-decreasing in every register, so a
// merge can never lower an estimate.
// =============================================================================

namespace wgc::sketch::hll {

using Register = std::uint8_t;

// =============================================================================
// Parameters
// =============================================================================

WGC_FORCE_INLINE constexpr Size num_registers(int precision) noexcept {
    return Size(1) << precision;
}

/// @throws RangeError unless precision is in [MIN_PRECISION, MAX_PRECISION]
inline void check_precision(int precision) {
    WGC_CHECK_RANGE(precision, config::MIN_PRECISION, config::MAX_PRECISION,
                    "HyperLogLog precision must be in [" +
                    std::to_string(config::MIN_PRECISION) + ", " +
                    std::to_string(config::MAX_PRECISION) + "], got " + std::to_string(precision));
}

/// Standard error 1.04 / sqrt(2^p).
inline double relative_error(int precision) noexcept {
    return 1.04 / std::sqrt(static_cast<double>(num_registers(precision)));
}

/// Smallest precision whose standard error is at most `target`.
/// @throws RangeError if `target` is not positive or not reachable at MAX_PRECISION
inline int precision_for_error(double target) {
    WGC_CHECK_ARG(target > 0.0 && std::isfinite(target), "target relative error must be positive");
    for (int p = config::MIN_PRECISION; p <= config::MAX_PRECISION; ++p) {
        if (relative_error(p) <= target) {
            return p;
        }
    }
    throw RangeError("target relative error " + std::to_string(target) +
                     " needs more than 2^" + std::to_string(config::MAX_PRECISION) + " registers");
}

// =============================================================================
// Hashing
// =============================================================================

/// splitmix64 finalizer over (node, seed). Fixed across platforms and runs.
WGC_FORCE_INLINE constexpr std::uint64_t hash_node(NodeId node, std::uint64_t seed) noexcept {
    std::uint64_t z = static_cast<std::uint64_t>(node) + seed + 0x9E3779B97F4A7C15ULL;
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

// =============================================================================
// Register Operations
// =============================================================================

WGC_FORCE_INLINE void insert_hash(Register* WGC_RESTRICT regs, int precision, std::uint64_t hash) noexcept {
    const int q = 64 - precision;
    const Size index = static_cast<Size>(hash >> q);
    const std::uint64_t w = hash << precision;
    const auto rank = static_cast<Register>(w == 0 ? q + 1 : std::countl_zero(w) + 1);
    if (rank > regs[index]) {
        regs[index] = rank;
    }
}

WGC_FORCE_INLINE void insert(Register* WGC_RESTRICT regs, int precision, NodeId node, std::uint64_t seed) noexcept {
    insert_hash(regs, precision, hash_node(node, seed));
}

/// dst = max(dst, src) register-wise. Returns true if any register of dst grew.
WGC_FORCE_INLINE bool merge(Register* WGC_RESTRICT dst, const Register* WGC_RESTRICT src, Size m) noexcept {
    namespace s = wgc::simd;
    const s::ByteTag d;
    const Size lanes = s::Lanes(d);

    bool changed = false;
    Size j = 0;

    for (; j + lanes <= m; j += lanes) {
        const auto v_dst = s::LoadU(d, dst + j);
        const auto v_max = s::Max(v_dst, s::LoadU(d, src + j));
        if (!s::AllTrue(d, s::Eq(v_max, v_dst))) {
            s::StoreU(v_max, d, dst + j);
            changed = true;
        }
    }

    for (; j < m; ++j) {
        const Register r = src[j];
        if (r > dst[j]) {
            dst[j] = r;
            changed = true;
        }
    }
    return changed;
}

WGC_FORCE_INLINE bool equal(const Register* a, const Register* b, Size m) noexcept {
    return std::memcmp(a, b, m) == 0;
}

// =============================================================================
// Estimation
// =============================================================================

namespace detail {

inline double sigma(double x) noexcept {
    if (x == 1.0) {
        return std::numeric_limits<double>::infinity();
    }
    double y = 1.0;
    double z = x;
    double z_prev;
    do {
        x *= x;
        z_prev = z;
        z += x * y;
        y += y;
    } while (z != z_prev);
    return z;
}

inline double tau(double x) noexcept {
    if (x == 0.0 || x == 1.0) {
        return 0.0;
    }
    double y = 1.0;
    double z = 1.0 - x;
    double z_prev;
    do {
        x = std::sqrt(x);
        z_prev = z;
        y *= 0.5;
        const double t = 1.0 - x;
        z -= t * t * y;
    } while (z != z_prev);
    return z / 3.0;
}

} // namespace detail

/// Estimated number of distinct hashes inserted. All-zero registers give 0.
inline double estimate(const Register* regs, int precision) noexcept {
    const int q = 64 - precision;
    const Size m = num_registers(precision);

    // Histogram of register values 0..q+1
    std::uint32_t counts[66] = {};
    for (Size j = 0; j < m; ++j) {
        ++counts[regs[j]];
    }
    if (counts[0] == m) {
        return 0.0;
    }

    const double md = static_cast<double>(m);
    double z = md * detail::tau(1.0 - static_cast<double>(counts[q + 1]) / md);
    for (int k = q; k >= 1; --k) {
        z = 0.5 * (z + static_cast<double>(counts[k]));
    }
    z += md * detail::sigma(static_cast<double>(counts[0]) / md);

    constexpr double two_ln2 = 2.0 * 0.69314718055994530942;
    return md * md / (two_ln2 * z);
}

} // namespace wgc::sketch::hll
