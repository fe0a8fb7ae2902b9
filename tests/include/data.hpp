#pragma once

// =============================================================================
// WGC - Test Data Generators
// =============================================================================
//
// Temporary directories, edge files and small published snapshots.
// Everything is reproducible from a seed.
// =============================================================================

#include "wgc/core/type.hpp"
#include "wgc/graph/builder.hpp"
#include "wgc/graph/identity.hpp"
#include "wgc/graph/snapshot.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <unistd.h>

namespace wgc::test {

class Random {
public:
    explicit Random(std::uint64_t seed = 42) : rng_(seed) {}

    /// Uniform random integer in [min, max]
    [[nodiscard]] std::int64_t uniform_int(std::int64_t min, std::int64_t max) {
        std::uniform_int_distribution<std::int64_t> dist(min, max);
        return dist(rng_);
    }

    [[nodiscard]] bool bernoulli(double p = 0.5) {
        std::bernoulli_distribution dist(p);
        return dist(rng_);
    }

    [[nodiscard]] std::mt19937_64& engine() { return rng_; }

private:
    std::mt19937_64 rng_;
};

/// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& tag = "wgc") {
        static std::atomic<std::uint64_t> counter{0};
        const auto base = std::filesystem::temp_directory_path();
        path_ = (base / (tag + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter.fetch_add(1))))
                    .string();
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::string& path() const { return path_; }
    [[nodiscard]] std::string sub(const std::string& name) const {
        return (std::filesystem::path(path_) / name).string();
    }

private:
    std::string path_;
};

using NamedEdge = std::pair<std::string, std::string>;

inline void write_text_file(const std::string& path, const std::string& contents) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << contents;
}

inline std::string read_text_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline void write_edge_file(const std::string& path, const std::vector<NamedEdge>& edges) {
    std::string text;
    for (const auto& [s, t] : edges) {
        text += s;
        text += '\t';
        text += t;
        text += '\n';
    }
    write_text_file(path, text);
}

/// Publish a snapshot from named edges; ids follow first-seen order.
inline graph::GraphSnapshot build_named(graph::SnapshotStore& store, const std::vector<NamedEdge>& edges,
                                        graph::BuildConfig config = {}) {
    graph::GraphBuilder builder(store, config);
    for (const auto& [s, t] : edges) {
        builder.add_edge(s, t);
    }
    return builder.finish();
}

/// Publish a snapshot over nodes "n0".."n{n-1}" with integer edges.
inline graph::GraphSnapshot build_numbered(graph::SnapshotStore& store, Size num_nodes,
                                           const std::vector<graph::Edge>& edges,
                                           graph::BuildConfig config = {}) {
    graph::NodeIdentityTable ids;
    for (Size i = 0; i < num_nodes; ++i) {
        ids.intern("n" + std::to_string(i));
    }
    return graph::GraphBuilder::build(store, std::move(ids), edges, config);
}

/// Directed G(n, p)-style random graph, self loops included with the same odds.
inline std::vector<graph::Edge> random_edges(Size num_nodes, Size num_edges, std::uint64_t seed = 42) {
    Random rng(seed);
    std::vector<graph::Edge> edges;
    edges.reserve(num_edges);
    const auto hi = static_cast<std::int64_t>(num_nodes) - 1;
    for (Size i = 0; i < num_edges; ++i) {
        edges.push_back(graph::Edge{static_cast<NodeId>(rng.uniform_int(0, hi)),
                                    static_cast<NodeId>(rng.uniform_int(0, hi))});
    }
    return edges;
}

} // namespace wgc::test
