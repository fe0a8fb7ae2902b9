#pragma once

#include "wgc/config.hpp"
#include "wgc/core/type.hpp"
#include "wgc/core/macros.hpp"

#include <algorithm>
#include <cstring>
#include <memory>
#include <new>
#include <type_traits>
#include <utility>

// =============================================================================
// FILE: wgc/core/memory.hpp
// BRIEF: Cache-aligned owning buffers for per-node arrays
// =============================================================================

namespace wgc::memory {

namespace detail {

struct AlignedFree {
    std::size_t alignment = DEFAULT_ALIGNMENT;

    void operator()(void* p) const noexcept {
        ::operator delete[](p, std::align_val_t(alignment));
    }
};

} // namespace detail

/// Fixed-size, zero-initialised array of trivially copyable T on an aligned
/// boundary. Sketch arenas and the per-node score arrays live in these.
///
/// @throws std::bad_alloc from the constructor
template <typename T>
class AlignedBuffer {
    static_assert(std::is_trivially_copyable_v<T>, "AlignedBuffer: T must be trivially copyable");

public:
    AlignedBuffer() noexcept = default;

    explicit AlignedBuffer(Size count, std::size_t alignment = DEFAULT_ALIGNMENT)
        : data_(nullptr, detail::AlignedFree{alignment}), count_(count) {
        if (count > 0) {
            void* raw = ::operator new[](count * sizeof(T), std::align_val_t(alignment));
            std::memset(raw, 0, count * sizeof(T));
            data_.reset(static_cast<T*>(raw));
        }
    }

    AlignedBuffer(AlignedBuffer&&) noexcept = default;
    AlignedBuffer& operator=(AlignedBuffer&&) noexcept = default;
    AlignedBuffer(const AlignedBuffer&) = delete;
    AlignedBuffer& operator=(const AlignedBuffer&) = delete;

    [[nodiscard]] T* get() noexcept { return data_.get(); }
    [[nodiscard]] const T* get() const noexcept { return data_.get(); }
    [[nodiscard]] Size size() const noexcept { return count_; }

    [[nodiscard]] Array<T> array() noexcept { return {data_.get(), count_}; }
    [[nodiscard]] Array<const T> array() const noexcept { return {data_.get(), count_}; }

    T& operator[](Size i) noexcept { return data_.get()[i]; }
    const T& operator[](Size i) const noexcept { return data_.get()[i]; }

    void swap(AlignedBuffer& other) noexcept {
        data_.swap(other.data_);
        std::swap(count_, other.count_);
    }

private:
    std::unique_ptr<T, detail::AlignedFree> data_{nullptr, detail::AlignedFree{}};
    Size count_ = 0;
};

template <typename T>
WGC_FORCE_INLINE void fill(Array<T> arr, T value) noexcept {
    std::fill(arr.begin(), arr.end(), value);
}

template <typename T>
WGC_FORCE_INLINE void zero(Array<T> arr) noexcept {
    if (!arr.empty()) {
        std::memset(static_cast<void*>(arr.data()), 0, arr.size() * sizeof(T));
    }
}

} // namespace wgc::memory
