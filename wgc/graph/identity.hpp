#pragma once

#include "wgc/core/type.hpp"
#include "wgc/core/error.hpp"
#include "wgc/core/macros.hpp"
#include "wgc/io/mmap.hpp"

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

// =============================================================================
// FILE: wgc/graph/identity.hpp
// BRIEF: External document identifier <-> dense NodeId mapping
// =============================================================================

namespace wgc::graph {

inline constexpr const char* IDS_FILE = "ids.bin";
inline constexpr const char* ID_OFFSETS_FILE = "id_offsets.bin";

// =============================================================================
// NodeIdentityTable
// =============================================================================

/// @brief Heap-resident mapping used while building a snapshot.
///
/// Ids are handed out in first-seen order and are never reassigned. On disk
/// the table is two flat arrays: `ids.bin` holds every identifier's bytes
/// back to back and `id_offsets.bin` holds N+1 uint64 offsets into it.
class NodeIdentityTable {
public:
    NodeIdentityTable() = default;

    NodeIdentityTable(const NodeIdentityTable&) = delete;
    NodeIdentityTable& operator=(const NodeIdentityTable&) = delete;
    NodeIdentityTable(NodeIdentityTable&&) noexcept = default;
    NodeIdentityTable& operator=(NodeIdentityTable&&) noexcept = default;

    /// @throws MalformedEdgeError on an empty identifier
    /// @throws OverflowError once the NodeId space is exhausted
    NodeId intern(std::string_view external_id);

    [[nodiscard]] std::optional<NodeId> find(std::string_view external_id) const;

    /// @throws UnknownNodeError if `node` >= size()
    [[nodiscard]] std::string_view resolve(NodeId node) const;

    [[nodiscard]] Size size() const noexcept { return ids_.size(); }
    [[nodiscard]] bool empty() const noexcept { return ids_.empty(); }

    void save(const std::string& dir) const;

    /// @throws FileNotFoundError if either file is missing
    /// @throws ReadError on inconsistent offsets or duplicate identifiers
    static NodeIdentityTable load(const std::string& dir);

private:
    // Deque keeps element addresses stable, so index_ may key on views.
    std::deque<std::string> ids_;
    std::unordered_map<std::string_view, NodeId> index_;
};

// =============================================================================
// MappedIdentityView
// =============================================================================

/// Read-only resolve() over a saved table without loading it into the heap.
class MappedIdentityView {
public:
    MappedIdentityView() = default;
    explicit MappedIdentityView(const std::string& dir);

    [[nodiscard]] Size size() const noexcept {
        return offsets_.empty() ? 0 : offsets_.size() - 1;
    }

    [[nodiscard]] std::string_view resolve(NodeId node) const {
        WGC_CHECK_NODE(node, size());
        const std::uint64_t begin = offsets_[node];
        const std::uint64_t end = offsets_[static_cast<Size>(node) + 1];
        return std::string_view(bytes_.data() + begin, end - begin);
    }

private:
    io::MappedArray<char> bytes_;
    io::MappedArray<std::uint64_t> offsets_;
};

} // namespace wgc::graph
