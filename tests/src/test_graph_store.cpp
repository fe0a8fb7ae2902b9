// =============================================================================
// WGC - Graph Builder and Snapshot Store Tests
// =============================================================================
//
// Coverage for wgc/graph/builder.hpp and wgc/graph/snapshot.hpp
//   GraphBuilder: add_edge, ingest, spill + k-way merge, finish
//   GraphSnapshot: out/in neighbours, degrees, self loops, identities
//   SnapshotStore: versions, CURRENT pointer, staging cleanup
//
// =============================================================================

#include "test.hpp"

#include "wgc/graph/builder.hpp"
#include "wgc/graph/edge_reader.hpp"
#include "wgc/graph/snapshot.hpp"

#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

using namespace wgc;
using namespace wgc::test;

namespace {

std::vector<NodeId> to_vec(Array<const NodeId> a) {
    return std::vector<NodeId>(a.begin(), a.end());
}

bool same_adjacency(const graph::GraphSnapshot& a, const graph::GraphSnapshot& b) {
    if (a.num_nodes() != b.num_nodes() || a.num_edges() != b.num_edges()) {
        return false;
    }
    for (Size i = 0; i < a.num_nodes(); ++i) {
        const auto x = static_cast<NodeId>(i);
        if (to_vec(a.out_neighbors(x)) != to_vec(b.out_neighbors(x)) ||
            to_vec(a.in_neighbors(x)) != to_vec(b.in_neighbors(x)) ||
            a.identities().resolve(x) != b.identities().resolve(x)) {
            return false;
        }
    }
    return true;
}

bool has_staging_leftovers(const std::string& root) {
    for (const auto& entry : std::filesystem::directory_iterator(std::filesystem::path(root) / "snapshots")) {
        if (entry.path().filename().string().find(".staging") != std::string::npos) {
            return true;
        }
    }
    return false;
}

} // namespace

WGC_TEST_BEGIN

// =============================================================================
// Adjacency
// =============================================================================

WGC_TEST_SUITE(adjacency)

WGC_TEST_CASE(forward_and_reverse_csr) {
    TempDir dir("graph");
    graph::SnapshotStore store(dir.path());
    const auto g = build_named(store, {{"A", "B"}, {"A", "C"}, {"B", "C"}, {"C", "A"}});

    WGC_ASSERT_EQ(g.num_nodes(), Size(3));
    WGC_ASSERT_EQ(g.num_edges(), Index(4));
    WGC_ASSERT_TRUE(to_vec(g.out_neighbors(0)) == (std::vector<NodeId>{1, 2}));
    WGC_ASSERT_TRUE(to_vec(g.in_neighbors(2)) == (std::vector<NodeId>{0, 1}));
    WGC_ASSERT_TRUE(to_vec(g.in_neighbors(0)) == (std::vector<NodeId>{2}));
    WGC_ASSERT_EQ(g.out_degree(0), Index(2));
    WGC_ASSERT_EQ(g.in_degree(1), Index(1));
}

WGC_TEST_CASE(duplicates_are_collapsed) {
    TempDir dir("graph");
    graph::SnapshotStore store(dir.path());
    const auto g = build_named(store, {{"a", "b"}, {"a", "b"}, {"b", "a"}, {"a", "b"}});
    WGC_ASSERT_EQ(g.num_edges(), Index(2));
    WGC_ASSERT_EQ(g.out_degree(0), Index(1));
}

WGC_TEST_CASE(self_loops_are_retained_and_counted) {
    TempDir dir("graph");
    graph::SnapshotStore store(dir.path());
    const auto g = build_named(store, {{"a", "a"}, {"a", "b"}, {"b", "b"}});
    WGC_ASSERT_EQ(g.num_edges(), Index(3));
    WGC_ASSERT_EQ(g.self_loop_count(), Index(2));
    WGC_ASSERT_TRUE(to_vec(g.out_neighbors(0)) == (std::vector<NodeId>{0, 1}));
}

WGC_TEST_CASE(neighbour_lists_ascend) {
    TempDir dir("graph");
    graph::SnapshotStore store(dir.path());
    const auto g = build_numbered(store, 200, random_edges(200, 3000, 7));
    for (NodeId x = 0; x < 200; ++x) {
        const auto out = to_vec(g.out_neighbors(x));
        const auto in = to_vec(g.in_neighbors(x));
        WGC_ASSERT_TRUE(std::is_sorted(out.begin(), out.end()));
        WGC_ASSERT_TRUE(std::adjacent_find(in.begin(), in.end()) == in.end());
        WGC_ASSERT_TRUE(std::is_sorted(in.begin(), in.end()));
    }
}

WGC_TEST_CASE(unknown_node_is_rejected) {
    TempDir dir("graph");
    graph::SnapshotStore store(dir.path());
    const auto g = build_named(store, {{"a", "b"}});
    WGC_ASSERT_THROWS((void)g.out_neighbors(2), UnknownNodeError);
    WGC_ASSERT_THROWS((void)g.in_degree(99), UnknownNodeError);
}

WGC_TEST_CASE(isolated_identities_have_empty_rows) {
    TempDir dir("graph");
    graph::SnapshotStore store(dir.path());
    const auto g = build_numbered(store, 5, {{0, 1}});
    WGC_ASSERT_EQ(g.num_nodes(), Size(5));
    WGC_ASSERT_EQ(g.out_neighbors(4).size(), Size(0));
    WGC_ASSERT_EQ(g.in_neighbors(4).size(), Size(0));
    WGC_ASSERT_STR_EQ("n4", std::string(g.identities().resolve(4)));
}

WGC_TEST_SUITE_END

// =============================================================================
// Build
// =============================================================================

WGC_TEST_SUITE(build)

WGC_TEST_CASE(spilled_runs_match_in_memory_build) {
    const auto edges = random_edges(500, 20000, 11);

    TempDir a("graph");
    graph::SnapshotStore store_a(a.path());
    const auto in_memory = build_numbered(store_a, 500, edges);

    TempDir b("graph");
    graph::SnapshotStore store_b(b.path());
    graph::BuildConfig cfg;
    cfg.max_buffered_edges = 777;
    const auto spilled = build_numbered(store_b, 500, edges, cfg);

    WGC_ASSERT_TRUE(same_adjacency(in_memory, spilled));
    WGC_ASSERT_FALSE(std::filesystem::exists(std::filesystem::path(spilled.path()) / "runs"));
}

WGC_TEST_CASE(rebuild_is_deterministic) {
    const std::vector<NamedEdge> edges = {{"x", "y"}, {"y", "z"}, {"z", "x"}, {"w", "x"}, {"y", "w"}};

    TempDir dir("graph");
    graph::SnapshotStore store(dir.path());
    write_edge_file(dir.sub("edges.tsv"), edges);

    graph::EdgeReader r1(dir.sub("edges.tsv"));
    const auto first = graph::GraphBuilder::build(store, r1);
    graph::EdgeReader r2(dir.sub("edges.tsv"));
    const auto second = graph::GraphBuilder::build(store, r2);

    WGC_ASSERT_EQ(first.version(), std::uint32_t(1));
    WGC_ASSERT_EQ(second.version(), std::uint32_t(2));
    WGC_ASSERT_TRUE(same_adjacency(first, second));
}

WGC_TEST_CASE(reuse_identities_keeps_existing_ids) {
    TempDir dir("graph");
    graph::SnapshotStore store(dir.path());
    build_named(store, {{"old1", "old2"}});

    graph::BuildConfig cfg;
    cfg.reuse_identities = true;
    const auto g = build_named(store, {{"new", "old2"}, {"old2", "old1"}}, cfg);

    WGC_ASSERT_EQ(g.num_nodes(), Size(3));
    WGC_ASSERT_STR_EQ("old1", std::string(g.identities().resolve(0)));
    WGC_ASSERT_STR_EQ("old2", std::string(g.identities().resolve(1)));
    WGC_ASSERT_STR_EQ("new", std::string(g.identities().resolve(2)));
}

WGC_TEST_CASE(malformed_input_publishes_nothing) {
    TempDir dir("graph");
    graph::SnapshotStore store(dir.path());
    write_text_file(dir.sub("bad.tsv"), "a\tb\nb\tc\nbroken-line\n");

    graph::EdgeReader reader(dir.sub("bad.tsv"));
    WGC_ASSERT_THROWS(graph::GraphBuilder::build(store, reader), MalformedEdgeError);

    WGC_ASSERT_FALSE(store.current_version().has_value());
    WGC_ASSERT_TRUE(store.list_versions().empty());
    WGC_ASSERT_FALSE(has_staging_leftovers(dir.path()));
}

WGC_TEST_CASE(out_of_range_edge_is_malformed) {
    TempDir dir("graph");
    graph::SnapshotStore store(dir.path());
    graph::NodeIdentityTable ids;
    ids.intern("a");
    ids.intern("b");
    const std::vector<graph::Edge> edges = {{0, 1}, {1, 2}};
    WGC_ASSERT_THROWS(graph::GraphBuilder::build(store, std::move(ids), edges), MalformedEdgeError);
    WGC_ASSERT_FALSE(store.current_version().has_value());
    WGC_ASSERT_FALSE(has_staging_leftovers(dir.path()));
}

WGC_TEST_CASE(empty_graph_publishes) {
    TempDir dir("graph");
    graph::SnapshotStore store(dir.path());
    const auto g = build_numbered(store, 0, {});
    WGC_ASSERT_EQ(g.num_nodes(), Size(0));
    WGC_ASSERT_EQ(g.num_edges(), Index(0));
}

WGC_TEST_SUITE_END

// =============================================================================
// Store
// =============================================================================

WGC_TEST_SUITE(store)

WGC_TEST_CASE(current_pointer_tracks_latest_publish) {
    TempDir dir("graph");
    graph::SnapshotStore store(dir.path());
    WGC_ASSERT_THROWS((void)store.open_latest(), FileNotFoundError);

    build_named(store, {{"a", "b"}});
    build_named(store, {{"a", "b"}, {"b", "c"}});

    WGC_ASSERT_EQ(*store.current_version(), std::uint32_t(2));
    WGC_ASSERT_TRUE(store.list_versions() == (std::vector<std::uint32_t>{1, 2}));

    const auto latest = store.open_latest();
    WGC_ASSERT_EQ(latest.num_nodes(), Size(3));
    WGC_ASSERT_EQ(store.open(1).num_nodes(), Size(2));
}

WGC_TEST_CASE(old_snapshot_readable_after_supersede) {
    TempDir dir("graph");
    graph::SnapshotStore store(dir.path());
    const auto v1 = build_named(store, {{"a", "b"}});
    build_named(store, {{"c", "d"}, {"d", "e"}});
    WGC_ASSERT_STR_EQ("b", std::string(v1.identities().resolve(1)));
    WGC_ASSERT_EQ(to_vec(v1.out_neighbors(0)).size(), Size(1));
}

WGC_TEST_CASE(stale_staging_is_replaced) {
    TempDir dir("graph");
    graph::SnapshotStore store(dir.path());
    const std::string stale = store.version_dir(1) + ".staging";
    std::filesystem::create_directories(stale);
    write_text_file(stale + "/junk", "x");

    const auto g = build_named(store, {{"a", "b"}});
    WGC_ASSERT_EQ(g.version(), std::uint32_t(1));
    WGC_ASSERT_FALSE(std::filesystem::exists(std::filesystem::path(g.path()) / "junk"));
}

WGC_TEST_CASE(version_names_are_zero_padded) {
    WGC_ASSERT_STR_EQ("v000001", graph::SnapshotStore::version_name(1));
    WGC_ASSERT_STR_EQ("v123456", graph::SnapshotStore::version_name(123456));
}

WGC_TEST_SUITE_END

WGC_TEST_END

WGC_TEST_MAIN()
