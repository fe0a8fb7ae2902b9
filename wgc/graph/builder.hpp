#pragma once

#include "wgc/config.hpp"
#include "wgc/core/type.hpp"
#include "wgc/core/error.hpp"
#include "wgc/graph/identity.hpp"
#include "wgc/graph/edge_reader.hpp"
#include "wgc/graph/snapshot.hpp"

#include <compare>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// =============================================================================
/// @file builder.hpp
/// @brief Bulk compaction of a raw edge stream into a published snapshot
///
/// Edges are buffered in memory up to `max_buffered_edges`. A full buffer is
/// sorted, deduplicated and spilled to a run file in the staging directory.
/// finish() k-way merges the runs into the forward CSR, scatters the reverse
/// CSR through a writable mapping, writes the identity table and metadata,
/// then publishes the staging directory. A builder that is destroyed before
/// finish() succeeds removes its staging directory, so a failed build never
/// leaves a visible snapshot.
// =============================================================================

namespace wgc::graph {

struct Edge {
    NodeId source;
    NodeId target;

    friend constexpr auto operator<=>(const Edge&, const Edge&) = default;
};

static_assert(sizeof(Edge) == 8);

struct BuildConfig {
    Size max_buffered_edges = config::DEFAULT_MAX_BUFFERED_EDGES;

    // Start from the identity table of the current snapshot so rebuilds keep
    // existing ids; new identifiers are appended.
    bool reuse_identities = false;

    /// @throws ValueError
    void validate() const {
        WGC_CHECK_ARG(max_buffered_edges > 0, "BuildConfig: max_buffered_edges must be positive");
    }
};

struct BuildStats {
    std::uint64_t records_read = 0;
    std::uint64_t edges_added = 0;
    std::uint64_t runs_spilled = 0;
    Size num_nodes = 0;
    Index num_edges = 0;
    Index self_loops = 0;
};

class GraphBuilder {
public:
    explicit GraphBuilder(SnapshotStore& store, BuildConfig config = {});

    /// Seeds the builder with an existing identity table.
    GraphBuilder(SnapshotStore& store, NodeIdentityTable identities, BuildConfig config = {});

    ~GraphBuilder();

    GraphBuilder(const GraphBuilder&) = delete;
    GraphBuilder& operator=(const GraphBuilder&) = delete;

    [[nodiscard]] NodeIdentityTable& identities() noexcept { return identities_; }
    [[nodiscard]] const NodeIdentityTable& identities() const noexcept { return identities_; }

    /// @throws MalformedEdgeError if an endpoint is not an interned node
    void add_edge(Edge edge);

    /// Interns both endpoints, then adds the edge.
    void add_edge(std::string_view source, std::string_view target);

    /// Drains `reader`; returns the number of records consumed.
    std::uint64_t ingest(EdgeReader& reader);

    /// Compact, persist and publish. The builder cannot be reused afterwards.
    GraphSnapshot finish();

    [[nodiscard]] std::uint32_t version() const noexcept { return version_; }
    [[nodiscard]] const std::string& staging_dir() const noexcept { return staging_dir_; }
    [[nodiscard]] const BuildStats& stats() const noexcept { return stats_; }

    // -------------------------------------------------------------------------
    // One-shot helpers
    // -------------------------------------------------------------------------

    static GraphSnapshot build(SnapshotStore& store, EdgeReader& reader, BuildConfig config = {});

    /// Edges over an already populated identity table.
    static GraphSnapshot build(SnapshotStore& store, NodeIdentityTable identities,
                               std::span<const Edge> edges, BuildConfig config = {});

private:
    void spill();
    void write_snapshot(std::vector<Edge>& in_memory);
    void discard_staging() noexcept;

    SnapshotStore& store_;
    BuildConfig config_;
    NodeIdentityTable identities_;
    std::vector<Edge> buffer_;
    std::vector<std::string> runs_;
    std::uint32_t version_ = 0;
    std::string staging_dir_;
    BuildStats stats_;
    bool finished_ = false;
};

} // namespace wgc::graph
