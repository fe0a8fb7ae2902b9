#pragma once

#include "wgc/config.hpp"
#include "wgc/core/type.hpp"
#include "wgc/core/error.hpp"
#include "wgc/core/macros.hpp"
#include "wgc/io/mmap.hpp"
#include "wgc/graph/identity.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// =============================================================================
/// @file snapshot.hpp
/// @brief Immutable disk-backed graph snapshots and their versioned store
///
/// Snapshot directory layout:
///
///   out_indptr.bin   Index[N+1]   forward CSR offsets
///   out_indices.bin  NodeId[E]    targets, ascending within each row
///   in_indptr.bin    Index[N+1]   reverse CSR offsets
///   in_indices.bin   NodeId[E]    sources, ascending within each row
///   ids.bin / id_offsets.bin      identity table
///   graph.meta                    "key value" lines
///
/// Store layout:
///
///   <root>/snapshots/v000001/ ...
///   <root>/CURRENT               name of the live snapshot directory
///
/// Snapshots are never modified after publish(). A newer snapshot replaces an
/// older one by rewriting CURRENT, so readers of the old one are unaffected.
// =============================================================================

namespace wgc::graph {

inline constexpr const char* OUT_INDPTR_FILE = "out_indptr.bin";
inline constexpr const char* OUT_INDICES_FILE = "out_indices.bin";
inline constexpr const char* IN_INDPTR_FILE = "in_indptr.bin";
inline constexpr const char* IN_INDICES_FILE = "in_indices.bin";
inline constexpr const char* META_FILE = "graph.meta";

// =============================================================================
// GraphSnapshot
// =============================================================================

/// @brief Read-only view of one published snapshot.
///
/// All accessors are const and safe for any number of concurrent readers.
class GraphSnapshot {
public:
    /// @throws FileNotFoundError if a snapshot file is missing
    /// @throws ReadError if array sizes disagree with graph.meta
    static GraphSnapshot open(const std::string& dir);

    GraphSnapshot(GraphSnapshot&&) noexcept = default;
    GraphSnapshot& operator=(GraphSnapshot&&) noexcept = default;
    GraphSnapshot(const GraphSnapshot&) = delete;
    GraphSnapshot& operator=(const GraphSnapshot&) = delete;

    [[nodiscard]] std::uint32_t version() const noexcept { return version_; }
    [[nodiscard]] Size num_nodes() const noexcept { return num_nodes_; }
    [[nodiscard]] Index num_edges() const noexcept { return num_edges_; }
    [[nodiscard]] Index self_loop_count() const noexcept { return self_loops_; }
    [[nodiscard]] const std::string& path() const noexcept { return dir_; }

    /// @throws UnknownNodeError
    [[nodiscard]] Array<const NodeId> out_neighbors(NodeId node) const {
        WGC_CHECK_NODE(node, num_nodes_);
        return out_neighbors_unsafe(node);
    }

    /// @throws UnknownNodeError
    [[nodiscard]] Array<const NodeId> in_neighbors(NodeId node) const {
        WGC_CHECK_NODE(node, num_nodes_);
        return in_neighbors_unsafe(node);
    }

    // Unchecked variants for the round kernel; node must be < num_nodes().
    [[nodiscard]] WGC_FORCE_INLINE Array<const NodeId> out_neighbors_unsafe(NodeId node) const noexcept {
        return row(out_indptr_, out_indices_, node);
    }

    [[nodiscard]] WGC_FORCE_INLINE Array<const NodeId> in_neighbors_unsafe(NodeId node) const noexcept {
        return row(in_indptr_, in_indices_, node);
    }

    [[nodiscard]] Index out_degree(NodeId node) const {
        WGC_CHECK_NODE(node, num_nodes_);
        return out_indptr_[node + Size(1)] - out_indptr_[node];
    }

    [[nodiscard]] Index in_degree(NodeId node) const {
        WGC_CHECK_NODE(node, num_nodes_);
        return in_indptr_[node + Size(1)] - in_indptr_[node];
    }

    [[nodiscard]] const MappedIdentityView& identities() const noexcept { return identities_; }

    /// Switch the neighbour arrays to random-access paging.
    void advise_random() const noexcept {
        out_indices_.advise_random();
        in_indices_.advise_random();
    }

private:
    GraphSnapshot() = default;

    static WGC_FORCE_INLINE Array<const NodeId> row(const io::MappedArray<Index>& indptr,
                                                    const io::MappedArray<NodeId>& indices,
                                                    NodeId node) noexcept {
        const Index begin = indptr[node];
        const Index end = indptr[node + Size(1)];
        return Array<const NodeId>(indices.data() + begin, static_cast<Size>(end - begin));
    }

    std::string dir_;
    std::uint32_t version_ = 0;
    Size num_nodes_ = 0;
    Index num_edges_ = 0;
    Index self_loops_ = 0;

    io::MappedArray<Index> out_indptr_;
    io::MappedArray<NodeId> out_indices_;
    io::MappedArray<Index> in_indptr_;
    io::MappedArray<NodeId> in_indices_;
    MappedIdentityView identities_;
};

// =============================================================================
// SnapshotStore
// =============================================================================

class SnapshotStore {
public:
    /// Creates `<root>/snapshots` if needed.
    explicit SnapshotStore(std::string root);

    [[nodiscard]] const std::string& root() const noexcept { return root_; }

    /// Published versions, ascending. Staging directories are not listed.
    [[nodiscard]] std::vector<std::uint32_t> list_versions() const;

    /// Version named by CURRENT, or nullopt if nothing was published yet.
    [[nodiscard]] std::optional<std::uint32_t> current_version() const;

    [[nodiscard]] std::uint32_t next_version() const;

    [[nodiscard]] std::string version_dir(std::uint32_t version) const;

    /// Fresh, empty staging directory for `version`. A stale one is replaced.
    std::string begin_staging(std::uint32_t version) const;

    /// Rename the staging directory into place, then advance CURRENT.
    void publish(const std::string& staging_dir, std::uint32_t version);

    /// @throws FileNotFoundError if no snapshot was published
    [[nodiscard]] GraphSnapshot open_latest() const;

    [[nodiscard]] GraphSnapshot open(std::uint32_t version) const;

    static std::string version_name(std::uint32_t version);

private:
    std::string root_;
    std::string snapshots_dir_;
    std::string current_path_;
};

} // namespace wgc::graph
