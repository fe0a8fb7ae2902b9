#pragma once

#include "wgc/config.hpp"
#include "wgc/core/type.hpp"
#include "wgc/core/error.hpp"
#include "wgc/engine/config.hpp"
#include "wgc/engine/state.hpp"
#include "wgc/graph/snapshot.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// =============================================================================
/// @file checkpoint.hpp
/// @brief Durable per-round engine checkpoints in HDF5
///
/// Directory layout:
///
///   round_000007.h5   one self-contained file per committed round
///   LATEST            name of the newest committed file
///
/// A round is committed by writing `round_NNNNNN.h5.tmp`, fsyncing it,
/// renaming it into place and then rewriting LATEST the same way. A crash at
/// any point leaves LATEST naming a complete file. Files newer than LATEST
/// are leftovers of an interrupted commit and are discarded on resume.
///
/// File contents (root attributes):
///   format_version, round, terminal, reason, last_round_delta,
///   num_nodes, precision, seed, direction, graph_version
/// Datasets:
///   registers {N, 2^p} uint8, accumulators/compensation/estimates {N} f64,
///   changed {N} uint8
// =============================================================================

namespace wgc::engine {

struct CheckpointInfo {
    std::uint32_t round = 0;
    bool terminal = false;
    std::string path;
};

class CheckpointManager {
public:
    /// Creates `dir` if needed.
    /// @throws ValueError if keep_last is 0
    explicit CheckpointManager(std::string dir, Size keep_last = config::DEFAULT_KEEP_CHECKPOINTS);

    /// Persist the state reached after `round`. Never replaces an existing
    /// checkpoint file; older files beyond keep_last are pruned afterwards.
    ///
    /// @throws WriteError if the round was already committed
    /// @throws IOError on HDF5 or filesystem failure (previous checkpoint intact)
    CheckpointInfo commit(std::uint32_t round, const EngineState& state);

    /// Latest committed state, validated against the run about to start.
    /// Returns nullopt (and logs) when there is nothing to resume from.
    ///
    /// @throws CheckpointMismatchError if the checkpoint belongs to another
    ///         graph, precision, seed or direction, or is past max_rounds
    [[nodiscard]] std::optional<EngineState> resume(const graph::GraphSnapshot& graph,
                                                    const EngineConfig& config);

    /// Load one checkpoint file without validation.
    [[nodiscard]] static EngineState load(const std::string& path);

    /// Committed rounds on disk, ascending.
    [[nodiscard]] std::vector<std::uint32_t> list() const;

    [[nodiscard]] std::optional<std::uint32_t> latest_round() const;

    /// Remove every checkpoint and the LATEST pointer.
    void clear();

    [[nodiscard]] const std::string& dir() const noexcept { return dir_; }
    [[nodiscard]] Size keep_last() const noexcept { return keep_last_; }
    [[nodiscard]] std::string path_for(std::uint32_t round) const;

    static std::string file_name(std::uint32_t round);

private:
    void prune(std::uint32_t newest);
    void discard_uncommitted(std::uint32_t latest);

    std::string dir_;
    std::string latest_path_;
    Size keep_last_;
};

} // namespace wgc::engine
