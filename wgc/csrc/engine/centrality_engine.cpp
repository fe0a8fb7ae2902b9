#include "wgc/engine/centrality_engine.hpp"

#include <glog/logging.h>

#include <utility>

namespace wgc::engine {

CentralityEngine::CentralityEngine(const graph::GraphSnapshot& graph, EngineConfig config)
    : graph_(graph), config_(std::move(config)) {
    config_.validate();

    if (!config_.checkpoint_dir.empty()) {
        checkpoints_.emplace(config_.checkpoint_dir, config_.keep_checkpoints);
    }

    std::optional<EngineState> resumed;
    if (checkpoints_ && config_.resume) {
        resumed = checkpoints_->resume(graph_, config_);
    }

    if (resumed) {
        resumed_from_ = resumed->round;
        state_ = std::move(*resumed);
    } else {
        state_ = EngineState::initial(graph_, config_);
    }

    // Only the round cap stopped the resumed run; a raised cap continues it.
    if (state_.terminal && state_.reason == TerminalReason::RoundLimit && state_.round < config_.max_rounds) {
        LOG(INFO) << "Extending run stopped at round " << state_.round << " to max_rounds " << config_.max_rounds;
        state_.terminal = false;
        state_.reason = TerminalReason::None;
    }
    if (!state_.terminal && state_.round >= config_.max_rounds) {
        state_.terminal = true;
        state_.reason = TerminalReason::RoundLimit;
    }

    const Size n = graph_.num_nodes();
    next_ = sketch::SketchRegistry(n, config_.precision, config_.seed);
    changed_next_ = memory::AlignedBuffer<Byte>(n);
    deltas_ = memory::AlignedBuffer<double>(n);

    graph_.advise_random();
    update_progress();

    LOG(INFO) << "Centrality engine: " << n << " nodes, " << graph_.num_edges() << " edges, p="
              << config_.precision << " (rse " << sketch::hll::relative_error(config_.precision)
              << "), direction=" << to_string(config_.direction) << ", max_rounds=" << config_.max_rounds
              << ", starting after round " << state_.round;
}

bool CentralityEngine::step() {
    if (state_.terminal) {
        return true;
    }

    const std::uint32_t round = state_.round + 1;

    kernel::harmonic::RoundArrays arrays;
    arrays.changed_prev = state_.changed.array();
    arrays.changed_next = changed_next_.array();
    arrays.estimates = state_.estimates.array();
    arrays.accumulators = state_.accumulators.array();
    arrays.compensation = state_.compensation.array();
    arrays.deltas = deltas_.array();

    last_stats_ = kernel::harmonic::run_round(graph_, config_.direction, round,
                                              state_.sketches, next_, arrays);

    state_.sketches.swap(next_);
    state_.changed.swap(changed_next_);
    state_.round = round;
    state_.last_round_delta = last_stats_.total_delta;

    const double threshold = config_.convergence_fraction * static_cast<double>(state_.num_nodes());
    if (last_stats_.nodes_changed == 0) {
        state_.terminal = true;
        state_.reason = TerminalReason::Stable;
    } else if (last_stats_.total_delta < threshold) {
        state_.terminal = true;
        state_.reason = TerminalReason::Converged;
    } else if (round >= config_.max_rounds) {
        state_.terminal = true;
        state_.reason = TerminalReason::RoundLimit;
    }

    LOG(INFO) << "Round " << round << ": delta=" << last_stats_.total_delta
              << " changed=" << last_stats_.nodes_changed
              << " recomputed=" << last_stats_.nodes_recomputed
              << (state_.terminal ? std::string(" terminal (") + to_string(state_.reason) + ")" : std::string());

    if (checkpoints_) {
        checkpoints_->commit(round, state_);
    }
    update_progress();
    return state_.terminal;
}

CentralityResult CentralityEngine::run() {
    while (!state_.terminal) {
        if (stop_requested()) {
            LOG(WARNING) << "Stop requested; halting after round " << state_.round;
            break;
        }
        step();
    }
    return result();
}

CentralityResult CentralityEngine::result() const {
    CentralityResult out;
    out.rounds_completed = state_.round;
    out.terminal = state_.terminal;
    out.reason = state_.reason;
    out.graph_version = graph_.version();
    out.direction = config_.direction;
    out.resumed_from = resumed_from_;
    out.scores.assign(state_.accumulators.get(), state_.accumulators.get() + state_.accumulators.size());
    return out;
}

void CentralityEngine::update_progress() noexcept {
    if (state_.terminal) {
        progress_.set(100);
        return;
    }
    progress_.set(static_cast<std::uint64_t>(state_.round) * 100 / config_.max_rounds);
}

} // namespace wgc::engine
