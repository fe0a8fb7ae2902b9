#pragma once

#include "wgc/core/type.hpp"
#include "wgc/core/memory.hpp"
#include "wgc/engine/checkpoint.hpp"
#include "wgc/engine/config.hpp"
#include "wgc/engine/state.hpp"
#include "wgc/graph/snapshot.hpp"
#include "wgc/kernel/harmonic.hpp"
#include "wgc/progress.hpp"
#include "wgc/sketch/registry.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <vector>

// =============================================================================
// FILE: wgc/engine/centrality_engine.hpp
// BRIEF: Round-by-round driver for approximate harmonic centrality
// =============================================================================

namespace wgc::engine {

struct CentralityResult {
    std::uint32_t rounds_completed = 0;
    bool terminal = false;
    TerminalReason reason = TerminalReason::None;
    std::uint32_t graph_version = 0;
    Direction direction = Direction::Inbound;
    std::optional<std::uint32_t> resumed_from;

    // Indexed by NodeId.
    std::vector<double> scores;

    [[nodiscard]] Size num_nodes() const noexcept { return scores.size(); }
};

/// @brief Runs HyperBall rounds over one graph snapshot.
///
/// The constructor either resumes from the latest checkpoint in
/// `config.checkpoint_dir` or seeds round 0. Each step() runs one round over
/// every node, swaps sketch generations, evaluates the stopping rules and
/// commits a checkpoint before returning. run() steps until the state is
/// terminal or a stop is requested; a stop is only honoured between rounds.
class CentralityEngine {
public:
    /// @throws ValueError / RangeError on invalid configuration
    /// @throws CheckpointMismatchError if resuming against another run's state
    CentralityEngine(const graph::GraphSnapshot& graph, EngineConfig config);

    CentralityEngine(const CentralityEngine&) = delete;
    CentralityEngine& operator=(const CentralityEngine&) = delete;

    CentralityResult run();

    /// One round plus its checkpoint. No-op on a terminal state.
    /// @return true if the state is terminal afterwards
    bool step();

    void request_stop() noexcept { stop_.store(true, std::memory_order_release); }

    /// Additional stop source polled between rounds (signal handlers, C API).
    void set_cancel_flag(const std::atomic<bool>* flag) noexcept { external_stop_ = flag; }

    [[nodiscard]] bool stop_requested() const noexcept {
        return stop_.load(std::memory_order_acquire) ||
               (external_stop_ && external_stop_->load(std::memory_order_acquire));
    }

    [[nodiscard]] const EngineState& state() const noexcept { return state_; }
    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }
    [[nodiscard]] bool terminal() const noexcept { return state_.terminal; }

    /// Scores as of the last completed round (terminal or not).
    [[nodiscard]] CentralityResult result() const;

    [[nodiscard]] progress::ProgressValue progress_percent() const noexcept { return progress_.get(); }
    [[nodiscard]] const kernel::harmonic::RoundStats& last_round_stats() const noexcept { return last_stats_; }

private:
    void update_progress() noexcept;

    const graph::GraphSnapshot& graph_;
    EngineConfig config_;
    std::optional<CheckpointManager> checkpoints_;
    std::optional<std::uint32_t> resumed_from_;

    EngineState state_;
    sketch::SketchRegistry next_;
    memory::AlignedBuffer<Byte> changed_next_;
    memory::AlignedBuffer<double> deltas_;
    kernel::harmonic::RoundStats last_stats_;

    progress::ProgressHandle progress_;
    std::atomic<bool> stop_{false};
    const std::atomic<bool>* external_stop_ = nullptr;
};

} // namespace wgc::engine
