#pragma once

#include "wgc/core/type.hpp"
#include "wgc/core/error.hpp"
#include "wgc/core/macros.hpp"
#include "wgc/graph/snapshot.hpp"
#include "wgc/sketch/registry.hpp"
#include "wgc/threading/parallel_for.hpp"
#include "wgc/threading/scheduler.hpp"
#include "wgc/threading/workspace.hpp"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <string_view>

// =============================================================================
// FILE: wgc/kernel/harmonic.hpp
// BRIEF: One HyperBall round of approximate harmonic centrality
//
// Round r turns generation r-1 (prev) into generation r (next):
//
//   next[x] = prev[x] | OR over expansion neighbours y of prev[y]
//   delta_x = max(0, |next[x]| - |prev[x]|)      nodes first reached at r
//   acc[x] += delta_x / r                         Kahan-compensated
//
// prev is read-only for the whole round and next[x] is written only by x's
// iteration, so the result does not depend on scheduling. A node none of
// whose neighbours changed in round r-1 cannot change in round r; it is
// copied forward without merging.
// =============================================================================

namespace wgc::kernel::harmonic {

/// Which adjacency a node's sketch expands over.
///   Inbound:  merge in-neighbours; the score sums over nodes that reach x.
///   Outbound: merge out-neighbours; the score sums over nodes x reaches.
enum class Direction : std::uint8_t {
    Inbound = 0,
    Outbound = 1
};

inline constexpr const char* to_string(Direction d) noexcept {
    return d == Direction::Inbound ? "inbound" : "outbound";
}

/// @throws ValueError on anything but "inbound" / "outbound"
inline Direction parse_direction(std::string_view s) {
    if (s == "inbound") return Direction::Inbound;
    if (s == "outbound") return Direction::Outbound;
    throw ValueError("Unknown direction '" + std::string(s) + "' (expected inbound or outbound)");
}

namespace config {
    inline constexpr Size GRAIN = 256;
    inline constexpr Size PREFETCH_DISTANCE = 4;
}

struct RoundStats {
    double total_delta = 0.0;
    std::uint64_t nodes_changed = 0;
    std::uint64_t nodes_recomputed = 0;
};

/// Per-node arrays carried across rounds. All have num_nodes entries.
struct RoundArrays {
    Array<const Byte> changed_prev;
    Array<Byte> changed_next;
    Array<double> estimates;        // |prev[x]| in, |next[x]| out
    Array<double> accumulators;
    Array<double> compensation;
    Array<double> deltas;           // out
};

namespace detail {

template <Direction D>
WGC_FORCE_INLINE Array<const NodeId> expansion(const graph::GraphSnapshot& g, NodeId x) noexcept {
    if constexpr (D == Direction::Inbound) {
        return g.in_neighbors_unsafe(x);
    } else {
        return g.out_neighbors_unsafe(x);
    }
}

template <Direction D>
RoundStats run_round_impl(
    const graph::GraphSnapshot& graph,
    std::uint32_t round,
    const sketch::SketchRegistry& prev,
    sketch::SketchRegistry& next,
    const RoundArrays& a
) {
    const Size n = prev.num_nodes();
    const Size m = prev.registers_per_sketch();
    const int p = prev.precision();
    const double inv_round = 1.0 / static_cast<double>(round);

    // [0] nodes whose sketch grew, [1] nodes recomputed
    threading::WorkspacePool<std::uint64_t> counters(threading::Scheduler::get_num_threads(), 2);
    counters.zero_all();

    threading::parallel_for_dynamic(Size(0), n, config::GRAIN, [&](Size i, Size rank) {
        const auto x = static_cast<NodeId>(i);
        const Array<const NodeId> nbrs = expansion<D>(graph, x);

        bool dirty = false;
        for (NodeId y : nbrs) {
            if (a.changed_prev[y]) {
                dirty = true;
                break;
            }
        }

        sketch::SketchRegistry::Register* out = next.sketch(x);
        std::memcpy(out, prev.sketch(x), m);

        bool grew = false;
        if (dirty) {
            const Size len = nbrs.size();
            for (Size k = 0; k < len; ++k) {
                if (k + config::PREFETCH_DISTANCE < len) {
                    WGC_PREFETCH_READ(prev.sketch(nbrs[k + config::PREFETCH_DISTANCE]), 0);
                }
                const NodeId y = nbrs[k];
                if (y != x && a.changed_prev[y]) {
                    grew |= sketch::hll::merge(out, prev.sketch(y), m);
                }
            }
            counters.get(rank)[1] += 1;
        }

        double delta = 0.0;
        if (grew) {
            const double est = sketch::hll::estimate(out, p);
            delta = std::max(0.0, est - a.estimates[i]);
            a.estimates[i] = est;

            // Kahan step
            const double y = delta * inv_round - a.compensation[i];
            const double t = a.accumulators[i] + y;
            a.compensation[i] = (t - a.accumulators[i]) - y;
            a.accumulators[i] = t;

            counters.get(rank)[0] += 1;
        }

        a.changed_next[i] = grew ? Byte(1) : Byte(0);
        a.deltas[i] = delta;
    });

    RoundStats stats;
    for (Size i = 0; i < n; ++i) {
        stats.total_delta += a.deltas[i];
    }
    for (Size t = 0; t < counters.n_threads(); ++t) {
        stats.nodes_changed += counters.get(t)[0];
        stats.nodes_recomputed += counters.get(t)[1];
    }
    return stats;
}

} // namespace detail

/// Advance one round. `round` is 1-based.
///
/// @throws DimensionError if the registries or arrays do not match the graph
inline RoundStats run_round(
    const graph::GraphSnapshot& graph,
    Direction direction,
    std::uint32_t round,
    const sketch::SketchRegistry& prev,
    sketch::SketchRegistry& next,
    const RoundArrays& arrays
) {
    const Size n = graph.num_nodes();
    WGC_CHECK_ARG(round >= 1, "run_round: rounds are numbered from 1");
    WGC_CHECK_DIM(prev.num_nodes() == n, "run_round: sketch registry does not match graph");
    prev.check_compatible(next);
    WGC_CHECK_DIM(arrays.changed_prev.size() == n && arrays.changed_next.size() == n &&
                  arrays.estimates.size() == n && arrays.accumulators.size() == n &&
                  arrays.compensation.size() == n && arrays.deltas.size() == n,
                  "run_round: per-node arrays do not match graph");

    if (direction == Direction::Inbound) {
        return detail::run_round_impl<Direction::Inbound>(graph, round, prev, next, arrays);
    }
    return detail::run_round_impl<Direction::Outbound>(graph, round, prev, next, arrays);
}

} // namespace wgc::kernel::harmonic
