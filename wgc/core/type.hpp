#pragma once

#include "wgc/config.hpp"
#include "wgc/core/macros.hpp"

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <type_traits>

// =============================================================================
// FILE: wgc/core/type.hpp
// BRIEF: Scalar types and the non-owning Array<T> view
// =============================================================================

namespace wgc {

// -----------------------------------------------------------------------------
// Scalars
// -----------------------------------------------------------------------------

// CSR offsets and edge counts. Signed so offset arithmetic never wraps.
using Index = std::int64_t;

// Dense node identifier. Ids are assigned in [0, N) and never recycled.
using NodeId = std::uint32_t;
inline constexpr NodeId INVALID_NODE = std::numeric_limits<NodeId>::max();
inline constexpr std::uint64_t MAX_NODES = std::numeric_limits<NodeId>::max();

using Size = std::size_t;
using Byte = std::uint8_t;

// -----------------------------------------------------------------------------
// Array<T>
// -----------------------------------------------------------------------------

/// Pointer + length over memory owned elsewhere (a mapping, an arena, a
/// vector). Trivially copyable; pass by value.
template <typename T>
struct Array {
    using value_type = T;
    using size_type = Size;

    T* ptr = nullptr;
    Size len = 0;

    constexpr Array() noexcept = default;
    constexpr Array(T* p, Size n) noexcept : ptr(p), len(n) {}

    // Array<T> -> Array<const T>
    template <typename U>
        requires (std::is_const_v<T> && std::is_same_v<std::remove_const_t<T>, U>)
    constexpr Array(const Array<U>& other) noexcept : ptr(other.ptr), len(other.len) {}

    constexpr Array(std::span<T> s) noexcept : ptr(s.data()), len(s.size()) {}

    WGC_FORCE_INLINE constexpr T& operator[](Size i) const noexcept { return ptr[i]; }

    [[nodiscard]] constexpr T* data() const noexcept { return ptr; }
    [[nodiscard]] constexpr Size size() const noexcept { return len; }
    [[nodiscard]] constexpr bool empty() const noexcept { return len == 0; }

    [[nodiscard]] constexpr T* begin() const noexcept { return ptr; }
    [[nodiscard]] constexpr T* end() const noexcept { return ptr + len; }
};

/// Anything indexable with a size: Array, MappedArray, std::vector.
template <typename A>
concept ArrayLike = requires(const A& a, Size i) {
    typename A::value_type;
    { a.size() } -> std::convertible_to<Size>;
    { a[i] } -> std::convertible_to<const typename A::value_type&>;
    a.begin();
    a.end();
};

static_assert(std::is_trivially_copyable_v<Array<NodeId>>);
static_assert(ArrayLike<Array<const Index>>);

} // namespace wgc
