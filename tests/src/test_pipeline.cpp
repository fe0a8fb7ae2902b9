// =============================================================================
// WGC - End-to-End Pipeline Tests
// =============================================================================
//
// Coverage for wgc/engine/pipeline.hpp
//   build_graph: edge file -> published snapshot
//   compute_centrality: snapshot -> checkpointed run -> score file
//
// =============================================================================

#include "test.hpp"

#include "wgc/engine/checkpoint.hpp"
#include "wgc/engine/pipeline.hpp"

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <sstream>
#include <string>

using namespace wgc;
using namespace wgc::test;

namespace {

std::map<std::string, double> read_scores(const std::string& path) {
    std::map<std::string, double> out;
    std::istringstream in(read_text_file(path));
    std::string line;
    while (std::getline(in, line)) {
        const auto tab = line.find('\t');
        out[line.substr(0, tab)] = std::strtod(line.c_str() + tab + 1, nullptr);
    }
    return out;
}

struct Fixture {
    TempDir dir{"pipeline"};

    Fixture() {
        write_edge_file(dir.sub("edges.tsv"), {{"p1", "p2"}, {"p2", "p3"}, {"p3", "p1"}, {"p4", "p1"}});
    }

    engine::BuildRequest build_request() const {
        engine::BuildRequest req;
        req.edges_path = dir.sub("edges.tsv");
        req.graph_dir = dir.sub("graph");
        return req;
    }

    engine::CentralityRequest centrality_request() const {
        engine::CentralityRequest req;
        req.graph_dir = dir.sub("graph");
        req.output_path = dir.sub("scores.tsv");
        req.engine.precision = 14;
        req.engine.convergence_fraction = 0.0;
        req.engine.checkpoint_dir = dir.sub("ckpt");
        return req;
    }
};

} // namespace

WGC_TEST_BEGIN

WGC_TEST_SUITE(build)

WGC_TEST_CASE(summary_reports_snapshot) {
    Fixture f;
    const auto summary = engine::build_graph(f.build_request());
    WGC_ASSERT_EQ(summary.version, std::uint32_t(1));
    WGC_ASSERT_EQ(summary.num_nodes, Size(4));
    WGC_ASSERT_EQ(summary.num_edges, Index(4));
    WGC_ASSERT_EQ(summary.self_loops, Index(0));
    WGC_ASSERT_EQ(summary.records_read, std::uint64_t(4));
}

WGC_TEST_CASE(missing_edge_file) {
    Fixture f;
    auto req = f.build_request();
    req.edges_path = f.dir.sub("absent.tsv");
    WGC_ASSERT_THROWS(engine::build_graph(req), FileNotFoundError);
}

WGC_TEST_CASE(invalid_buffer_size) {
    Fixture f;
    auto req = f.build_request();
    req.build.max_buffered_edges = 0;
    WGC_ASSERT_THROWS(engine::build_graph(req), ValueError);
}

WGC_TEST_SUITE_END

WGC_TEST_SUITE(centrality)

WGC_TEST_CASE(scores_file_holds_inbound_harmonic) {
    Fixture f;
    engine::build_graph(f.build_request());
    const auto summary = engine::compute_centrality(f.centrality_request());

    WGC_ASSERT_TRUE(summary.completed);
    WGC_ASSERT_EQ(summary.reason, engine::TerminalReason::Stable);
    WGC_ASSERT_EQ(summary.scores_written, Size(4));
    WGC_ASSERT_FALSE(summary.resumed);

    const auto scores = read_scores(f.dir.sub("scores.tsv"));
    WGC_ASSERT_NEAR(scores.at("p1"), 2.5, 0.05);
    WGC_ASSERT_NEAR(scores.at("p2"), 2.0, 0.05);
    WGC_ASSERT_NEAR(scores.at("p3"), 1.8333, 0.05);
    WGC_ASSERT_EQ(scores.at("p4"), 0.0);
}

WGC_TEST_CASE(missing_graph) {
    Fixture f;
    WGC_ASSERT_THROWS(engine::compute_centrality(f.centrality_request()), FileNotFoundError);
}

WGC_TEST_CASE(top_k_and_normalize) {
    Fixture f;
    engine::build_graph(f.build_request());
    auto req = f.centrality_request();
    req.scores.top_k = 2;
    req.scores.normalize = true;
    engine::compute_centrality(req);

    const std::string text = read_text_file(f.dir.sub("scores.tsv"));
    WGC_ASSERT_TRUE(text.rfind("p1\t", 0) == 0);
    const auto scores = read_scores(f.dir.sub("scores.tsv"));
    WGC_ASSERT_EQ(scores.size(), Size(2));
    WGC_ASSERT_NEAR(scores.at("p2"), 2.0 / 3.0, 0.02);
}

WGC_TEST_CASE(cancelled_run_writes_nothing_then_resumes) {
    Fixture f;
    engine::build_graph(f.build_request());

    std::atomic<bool> cancel{true};
    auto req = f.centrality_request();
    req.cancel = &cancel;
    const auto stopped = engine::compute_centrality(req);
    WGC_ASSERT_FALSE(stopped.completed);
    WGC_ASSERT_FALSE(std::filesystem::exists(f.dir.sub("scores.tsv")));

    cancel.store(false);
    const auto done = engine::compute_centrality(req);
    WGC_ASSERT_TRUE(done.completed);
    WGC_ASSERT_TRUE(std::filesystem::exists(f.dir.sub("scores.tsv")));
}

WGC_TEST_CASE(second_run_resumes_terminal_checkpoint) {
    Fixture f;
    engine::build_graph(f.build_request());
    const auto first = engine::compute_centrality(f.centrality_request());
    const std::string first_text = read_text_file(f.dir.sub("scores.tsv"));

    const auto second = engine::compute_centrality(f.centrality_request());
    WGC_ASSERT_TRUE(second.resumed);
    WGC_ASSERT_EQ(second.rounds, first.rounds);
    WGC_ASSERT_STR_EQ(first_text, read_text_file(f.dir.sub("scores.tsv")));
}

WGC_TEST_CASE(rebuilt_graph_needs_fresh_run) {
    Fixture f;
    engine::build_graph(f.build_request());
    engine::compute_centrality(f.centrality_request());

    engine::build_graph(f.build_request());
    auto req = f.centrality_request();
    WGC_ASSERT_THROWS(engine::compute_centrality(req), CheckpointMismatchError);

    req.fresh = true;
    const auto summary = engine::compute_centrality(req);
    WGC_ASSERT_TRUE(summary.completed);
    WGC_ASSERT_FALSE(summary.resumed);
    WGC_ASSERT_EQ(summary.graph_version, std::uint32_t(2));
}

WGC_TEST_CASE(no_checkpoint_dir) {
    Fixture f;
    engine::build_graph(f.build_request());
    auto req = f.centrality_request();
    req.engine.checkpoint_dir.clear();
    const auto summary = engine::compute_centrality(req);
    WGC_ASSERT_TRUE(summary.completed);
    WGC_ASSERT_FALSE(summary.checkpointed);
    WGC_ASSERT_FALSE(std::filesystem::exists(f.dir.sub("ckpt")));

    // Nothing was kept, so a cancelled run has nothing to continue from.
    std::atomic<bool> cancel{true};
    req.cancel = &cancel;
    const auto stopped = engine::compute_centrality(req);
    WGC_ASSERT_FALSE(stopped.completed);
    WGC_ASSERT_FALSE(stopped.checkpointed);
    cancel.store(false);
    const auto again = engine::compute_centrality(req);
    WGC_ASSERT_FALSE(again.resumed);
    WGC_ASSERT_EQ(again.rounds, summary.rounds);
}

WGC_TEST_CASE(lower_round_cap_needs_fresh_run) {
    Fixture f;
    write_edge_file(f.dir.sub("edges.tsv"), {{"a", "b"}, {"b", "c"}, {"c", "d"}});
    engine::build_graph(f.build_request());
    const auto full = engine::compute_centrality(f.centrality_request());
    WGC_ASSERT_TRUE(full.checkpointed);
    WGC_ASSERT_GT(full.rounds, std::uint32_t(1));

    auto req = f.centrality_request();
    req.engine.max_rounds = 1;
    WGC_ASSERT_THROWS(engine::compute_centrality(req), CheckpointMismatchError);

    req.fresh = true;
    const auto capped = engine::compute_centrality(req);
    WGC_ASSERT_EQ(capped.reason, engine::TerminalReason::RoundLimit);
    WGC_ASSERT_EQ(capped.rounds, std::uint32_t(1));
    WGC_ASSERT_NEAR(read_scores(f.dir.sub("scores.tsv")).at("d"), 1.0, 0.05);
}

WGC_TEST_CASE(output_path_required) {
    Fixture f;
    engine::build_graph(f.build_request());
    auto req = f.centrality_request();
    req.output_path.clear();
    WGC_ASSERT_THROWS(engine::compute_centrality(req), ValueError);
}

WGC_TEST_SUITE_END

WGC_TEST_END

WGC_TEST_MAIN()
