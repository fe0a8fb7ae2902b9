#pragma once

#include "wgc/config.hpp"
#include "wgc/core/macros.hpp"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <thread>

// =============================================================================
// FILE: wgc/threading/scheduler.hpp
// BRIEF: Process-wide worker count for the selected threading backend
// =============================================================================

#if defined(WGC_USE_OPENMP)
    #include <omp.h>
#elif defined(WGC_USE_TBB)
    #include <tbb/global_control.h>
    #include <tbb/task_arena.h>
#endif

namespace wgc::threading {

class Scheduler {
public:
    static constexpr std::size_t MAX_THREADS = 1024;

    static std::size_t hardware_concurrency() noexcept {
        const unsigned hw = std::thread::hardware_concurrency();
        return hw == 0 ? 1 : hw;
    }

    /// 0 means one worker per hardware thread. Values above MAX_THREADS are clamped.
    static void set_num_threads(std::size_t n) {
        n = std::min(n == 0 ? hardware_concurrency() : n, MAX_THREADS);
#if defined(WGC_USE_OPENMP)
        omp_set_num_threads(static_cast<int>(n));
#elif defined(WGC_USE_TBB)
        // The limit holds only while the control object lives
        static std::unique_ptr<tbb::global_control> limit;
        limit.reset();
        limit = std::make_unique<tbb::global_control>(tbb::global_control::max_allowed_parallelism, n);
#else
        (void)n;
#endif
    }

    static void init(std::size_t n = 0) { set_num_threads(n); }

    /// One past the largest rank a parallel_for body can observe. Per-rank
    /// scratch is sized with this.
    static std::size_t get_num_threads() noexcept {
#if defined(WGC_USE_OPENMP)
        return static_cast<std::size_t>(std::max(omp_get_max_threads(), 1));
#elif defined(WGC_USE_TBB)
        const auto limit = tbb::global_control::active_value(tbb::global_control::max_allowed_parallelism);
        const auto arena = tbb::this_task_arena::max_concurrency();
        return std::max<std::size_t>({std::size_t(1), limit, static_cast<std::size_t>(std::max(arena, 1))});
#else
        return 1;
#endif
    }

    static constexpr const char* backend_name() noexcept {
#if defined(WGC_USE_OPENMP)
        return "openmp";
#elif defined(WGC_USE_TBB)
        return "tbb";
#else
        return "serial";
#endif
    }
};

} // namespace wgc::threading
