#pragma once

#include "wgc/config.hpp"
#include "wgc/core/macros.hpp"
#include "wgc/threading/scheduler.hpp"

#include <cstddef>
#include <type_traits>

// =============================================================================
// FILE: wgc/threading/parallel_for.hpp
// BRIEF: Dynamically scheduled loop over [begin, end) with thread rank
// =============================================================================

#if defined(WGC_USE_TBB)
    #include <tbb/blocked_range.h>
    #include <tbb/parallel_for.h>
    #include <tbb/task_arena.h>
#elif defined(WGC_USE_OPENMP)
    #include <omp.h>
#endif

namespace wgc::threading {

namespace detail {

// Bodies take (i) or (i, rank)
template <typename Body>
WGC_FORCE_INLINE void call(Body& body, std::size_t i, std::size_t rank) {
    if constexpr (std::is_invocable_v<Body&, std::size_t, std::size_t>) {
        body(i, rank);
    } else {
        body(i);
    }
}

} // namespace detail

/// Runs body once per index in [begin, end), handing out chunks of `grain`
/// indices on demand so skewed per-index costs (high-degree nodes) balance.
/// Returns after every index has finished. Called from inside an OpenMP
/// parallel region it runs inline on the calling thread.
template <typename Body>
void parallel_for_dynamic(std::size_t begin, std::size_t end, std::size_t grain, Body&& body) {
    if (begin >= end) {
        return;
    }
    grain = grain == 0 ? 1 : grain;

#if defined(WGC_USE_OPENMP)
    if (omp_in_parallel()) {
        const auto rank = static_cast<std::size_t>(omp_get_thread_num());
        for (std::size_t i = begin; i < end; ++i) {
            detail::call(body, i, rank);
        }
        return;
    }
    const int chunk = static_cast<int>(grain);
    #pragma omp parallel for schedule(dynamic, chunk)
    for (std::size_t i = begin; i < end; ++i) {
        detail::call(body, i, static_cast<std::size_t>(omp_get_thread_num()));
    }
#elif defined(WGC_USE_TBB)
    tbb::parallel_for(tbb::blocked_range<std::size_t>(begin, end, grain),
                      [&](const tbb::blocked_range<std::size_t>& r) {
                          const auto rank = static_cast<std::size_t>(tbb::this_task_arena::current_thread_index());
                          for (std::size_t i = r.begin(); i != r.end(); ++i) {
                              detail::call(body, i, rank);
                          }
                      });
#else
    for (std::size_t i = begin; i < end; ++i) {
        detail::call(body, i, 0);
    }
#endif
}

} // namespace wgc::threading
