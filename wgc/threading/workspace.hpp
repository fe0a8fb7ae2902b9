#pragma once

#include "wgc/config.hpp"
#include "wgc/core/type.hpp"
#include "wgc/core/macros.hpp"
#include "wgc/core/memory.hpp"

// =============================================================================
// FILE: wgc/threading/workspace.hpp
// BRIEF: Per-thread scratch slots indexed by thread rank
// =============================================================================

namespace wgc::threading {

/// `n_threads` slots of `capacity` elements in one allocation. Each slot
/// starts on its own cache line, so ranks can bump their counters without
/// false sharing.
template <typename T>
class WorkspacePool {
public:
    WorkspacePool(Size n_threads, Size capacity)
        : n_threads_(n_threads), capacity_(capacity),
          stride_(round_up(capacity)), buffer_(n_threads * stride_, WGC_ALIGNMENT) {}

    WorkspacePool(const WorkspacePool&) = delete;
    WorkspacePool& operator=(const WorkspacePool&) = delete;

    WGC_FORCE_INLINE T* get(Size rank) noexcept { return buffer_.get() + rank * stride_; }
    WGC_FORCE_INLINE const T* get(Size rank) const noexcept { return buffer_.get() + rank * stride_; }

    void zero_all() noexcept { memory::zero(buffer_.array()); }

    [[nodiscard]] Size n_threads() const noexcept { return n_threads_; }
    [[nodiscard]] Size capacity() const noexcept { return capacity_; }

private:
    static constexpr Size round_up(Size capacity) noexcept {
        constexpr Size per_line = sizeof(T) >= WGC_CACHE_LINE_SIZE ? 1 : WGC_CACHE_LINE_SIZE / sizeof(T);
        return (capacity + per_line - 1) / per_line * per_line;
    }

    Size n_threads_;
    Size capacity_;
    Size stride_;
    memory::AlignedBuffer<T> buffer_;
};

} // namespace wgc::threading
