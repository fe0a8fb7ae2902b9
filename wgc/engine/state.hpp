#pragma once

#include "wgc/core/type.hpp"
#include "wgc/core/memory.hpp"
#include "wgc/engine/config.hpp"
#include "wgc/graph/snapshot.hpp"
#include "wgc/sketch/registry.hpp"

#include <cstdint>

// =============================================================================
// FILE: wgc/engine/state.hpp
// BRIEF: Resumable engine state after a completed round
// =============================================================================

namespace wgc::engine {

enum class TerminalReason : std::uint8_t {
    None = 0,
    Converged = 1,      // round delta below convergence_fraction * N
    Stable = 2,         // no sketch changed
    RoundLimit = 3,     // round == max_rounds
    EmptyGraph = 4
};

inline constexpr const char* to_string(TerminalReason r) noexcept {
    switch (r) {
        case TerminalReason::None:       return "none";
        case TerminalReason::Converged:  return "converged";
        case TerminalReason::Stable:     return "stable";
        case TerminalReason::RoundLimit: return "round_limit";
        case TerminalReason::EmptyGraph: return "empty_graph";
    }
    return "unknown";
}

/// Everything needed to continue a run from `round`: the sketch generation
/// produced by that round plus per-node accumulators. `changed[x]` records
/// whether x's sketch grew during `round` (all ones at round 0).
struct EngineState {
    std::uint32_t round = 0;
    bool terminal = false;
    TerminalReason reason = TerminalReason::None;
    double last_round_delta = 0.0;

    std::uint32_t graph_version = 0;
    Direction direction = Direction::Inbound;

    sketch::SketchRegistry sketches;
    memory::AlignedBuffer<double> accumulators;
    memory::AlignedBuffer<double> compensation;
    memory::AlignedBuffer<double> estimates;
    memory::AlignedBuffer<Byte> changed;

    [[nodiscard]] Size num_nodes() const noexcept { return sketches.num_nodes(); }

    /// Zeroed arrays and registers for `num_nodes` nodes, not yet seeded.
    static EngineState allocate(Size num_nodes, const EngineConfig& config, std::uint32_t graph_version) {
        EngineState s;
        s.graph_version = graph_version;
        s.direction = config.direction;
        s.sketches = sketch::SketchRegistry(num_nodes, config.precision, config.seed);
        s.accumulators = memory::AlignedBuffer<double>(num_nodes);
        s.compensation = memory::AlignedBuffer<double>(num_nodes);
        s.estimates = memory::AlignedBuffer<double>(num_nodes);
        s.changed = memory::AlignedBuffer<Byte>(num_nodes);
        return s;
    }

    /// Round-0 state: every sketch holds its own node.
    static EngineState initial(const graph::GraphSnapshot& graph, const EngineConfig& config) {
        EngineState s = allocate(graph.num_nodes(), config, graph.version());
        s.sketches.seed_all();
        for (Size i = 0; i < s.num_nodes(); ++i) {
            s.estimates[i] = s.sketches.estimate(static_cast<NodeId>(i));
        }
        memory::fill(s.changed.array(), Byte(1));
        if (s.num_nodes() == 0) {
            s.terminal = true;
            s.reason = TerminalReason::EmptyGraph;
        }
        return s;
    }
};

} // namespace wgc::engine
