#pragma once

#include "wgc/core/type.hpp"
#include "wgc/engine/centrality_engine.hpp"
#include "wgc/engine/config.hpp"
#include "wgc/engine/score_writer.hpp"
#include "wgc/graph/builder.hpp"

#include <atomic>
#include <cstdint>
#include <string>

// =============================================================================
/// @file pipeline.hpp
/// @brief End-to-end operations shared by the CLI and the C API
///
/// build_graph:        edge TSV -> published snapshot under graph_dir
/// compute_centrality: current snapshot -> checkpointed rounds -> score TSV
// =============================================================================

namespace wgc::engine {

struct BuildRequest {
    std::string edges_path;
    std::string graph_dir;
    graph::BuildConfig build;
};

struct BuildSummary {
    std::uint32_t version = 0;
    Size num_nodes = 0;
    Index num_edges = 0;
    Index self_loops = 0;
    std::uint64_t records_read = 0;
};

/// @throws MalformedEdgeError, FileNotFoundError, IOError
BuildSummary build_graph(const BuildRequest& request);

struct CentralityRequest {
    std::string graph_dir;
    std::string output_path;
    EngineConfig engine;
    ScoreOptions scores;

    // Discard existing checkpoints before starting.
    bool fresh = false;

    // 0 keeps the scheduler default.
    Size threads = 0;

    const std::atomic<bool>* cancel = nullptr;
};

struct CentralitySummary {
    bool completed = false;
    std::uint32_t rounds = 0;
    TerminalReason reason = TerminalReason::None;
    std::uint32_t graph_version = 0;
    Size num_nodes = 0;
    Size scores_written = 0;
    bool resumed = false;
    // False when no checkpoint_dir was given; nothing on disk to resume from.
    bool checkpointed = false;
};

/// Runs to a terminal state and writes scores. When cancelled between rounds
/// the summary has completed == false and no score file is written; the
/// checkpoints on disk let a later call continue.
///
/// @throws CheckpointMismatchError, ValueError, IOError
CentralitySummary compute_centrality(const CentralityRequest& request);

} // namespace wgc::engine
