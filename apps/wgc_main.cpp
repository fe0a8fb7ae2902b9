// =============================================================================
// FILE: apps/wgc_main.cpp
// BRIEF: Command-line front end: `wgc build-graph`, `wgc centrality`
// =============================================================================
//
// Exit codes: 0 success, 1 failure, 2 usage error, 3 interrupted (the
// centrality run can be continued by rerunning the same command).

#include "wgc/config.hpp"
#include "wgc/core/error.hpp"
#include "wgc/core/log.hpp"
#include "wgc/engine/pipeline.hpp"
#include "wgc/version.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <atomic>
#include <csignal>
#include <cstdio>
#include <string>
#include <vector>

// build-graph
DEFINE_string(edges, "", "TSV edge file, one `source<TAB>target` per line");
DEFINE_string(graph_dir, "", "Snapshot store root");
DEFINE_bool(reuse_identities, false, "Keep node ids from the current snapshot");
DEFINE_uint64(max_buffered_edges, wgc::graph::config::DEFAULT_MAX_BUFFERED_EDGES,
              "Edges held in memory before a sorted run is spilled to disk");

// centrality
DEFINE_string(checkpoint_dir, "", "Per-round checkpoint directory; without it an interrupted run cannot resume");
DEFINE_string(output, "", "Score TSV, one `external_id<TAB>score` per line");
DEFINE_int32(precision, 0, "HyperLogLog precision p in [4, 16] (0: derive from --target_error or default)");
DEFINE_double(target_error, 0.0, "Target relative standard error per sketch");
DEFINE_uint32(max_rounds, wgc::engine::config::DEFAULT_MAX_ROUNDS, "Upper bound on rounds");
DEFINE_double(convergence_fraction, wgc::engine::config::DEFAULT_CONVERGENCE_FRACTION,
              "Stop when a round adds less than this fraction of N");
DEFINE_string(direction, "inbound", "inbound or outbound");
DEFINE_uint64(seed, wgc::sketch::config::DEFAULT_SEED, "Hash seed");
DEFINE_bool(fresh, false, "Discard existing checkpoints before starting");
DEFINE_bool(normalize, false, "Divide scores by N - 1");
DEFINE_uint64(top_k, 0, "Write only the k highest scores (0: all, node order)");
DEFINE_uint64(threads, 0, "Worker threads (0: backend default)");
DEFINE_uint64(keep_checkpoints, wgc::engine::config::DEFAULT_KEEP_CHECKPOINTS, "Checkpoints retained");

namespace {

constexpr int EXIT_CODE_OK = 0;
constexpr int EXIT_CODE_ERROR = 1;
constexpr int EXIT_CODE_USAGE = 2;
constexpr int EXIT_CODE_INTERRUPTED = 3;

std::atomic<bool> g_stop{false};

// The first signal stops between rounds; a second one kills the process.
extern "C" void on_signal(int sig) {
    g_stop.store(true);
    std::signal(sig, SIG_DFL);
}

constexpr const char* USAGE =
    "usage:\n"
    "  wgc build-graph --edges=F --graph_dir=D [--reuse_identities] [--max_buffered_edges=K]\n"
    "  wgc centrality --graph_dir=D --output=O [--checkpoint_dir=C] [--precision=P | --target_error=E]\n"
    "                 [--max_rounds=R] [--convergence_fraction=F] [--direction=inbound|outbound]\n"
    "                 [--fresh] [--normalize] [--top_k=K] [--threads=T] [--keep_checkpoints=K]\n";

int usage_error(const std::string& msg) {
    std::fprintf(stderr, "wgc: %s\n%s", msg.c_str(), USAGE);
    return EXIT_CODE_USAGE;
}

int run_build() {
    if (FLAGS_edges.empty() || FLAGS_graph_dir.empty()) {
        return usage_error("build-graph requires --edges and --graph_dir");
    }
    wgc::engine::BuildRequest request;
    request.edges_path = FLAGS_edges;
    request.graph_dir = FLAGS_graph_dir;
    request.build.reuse_identities = FLAGS_reuse_identities;
    request.build.max_buffered_edges = static_cast<wgc::Size>(FLAGS_max_buffered_edges);

    const auto summary = wgc::engine::build_graph(request);
    std::printf("version=%u nodes=%zu edges=%lld self_loops=%lld\n", summary.version, summary.num_nodes,
                static_cast<long long>(summary.num_edges), static_cast<long long>(summary.self_loops));
    return EXIT_CODE_OK;
}

int run_centrality() {
    if (FLAGS_graph_dir.empty() || FLAGS_output.empty()) {
        return usage_error("centrality requires --graph_dir and --output");
    }
    if (FLAGS_precision != 0 && FLAGS_target_error > 0.0) {
        return usage_error("--precision and --target_error are mutually exclusive");
    }

    wgc::engine::CentralityRequest request;
    request.graph_dir = FLAGS_graph_dir;
    request.output_path = FLAGS_output;
    request.fresh = FLAGS_fresh;
    request.threads = static_cast<wgc::Size>(FLAGS_threads);
    request.cancel = &g_stop;

    wgc::engine::EngineConfig& cfg = request.engine;
    if (FLAGS_precision != 0) {
        cfg.precision = FLAGS_precision;
    } else if (FLAGS_target_error > 0.0) {
        cfg.with_target_error(FLAGS_target_error);
    }
    cfg.max_rounds = FLAGS_max_rounds;
    cfg.convergence_fraction = FLAGS_convergence_fraction;
    cfg.direction = wgc::engine::parse_direction(FLAGS_direction);
    cfg.seed = FLAGS_seed;
    cfg.checkpoint_dir = FLAGS_checkpoint_dir;
    cfg.keep_checkpoints = static_cast<wgc::Size>(FLAGS_keep_checkpoints);

    request.scores.normalize = FLAGS_normalize;
    request.scores.top_k = static_cast<wgc::Size>(FLAGS_top_k);

    const auto summary = wgc::engine::compute_centrality(request);
    if (!summary.completed) {
        std::fprintf(stderr, "wgc: interrupted after round %u\n", summary.rounds);
        return EXIT_CODE_INTERRUPTED;
    }
    std::printf("rounds=%u reason=%s nodes=%zu written=%zu checkpointed=%d\n", summary.rounds,
                wgc::engine::to_string(summary.reason), summary.num_nodes, summary.scores_written,
                summary.checkpointed ? 1 : 0);
    return EXIT_CODE_OK;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    gflags::SetUsageMessage(USAGE);
    gflags::SetVersionString(wgc::version_string());

    if (argc < 2 || argv[1][0] == '-') {
        return usage_error("missing subcommand");
    }
    const std::string command = argv[1];

    // Drop the subcommand so gflags only sees flags.
    std::vector<char*> args;
    args.push_back(argv[0]);
    for (int i = 2; i < argc; ++i) {
        args.push_back(argv[i]);
    }
    int flag_argc = static_cast<int>(args.size());
    char** flag_argv = args.data();
    gflags::ParseCommandLineFlags(&flag_argc, &flag_argv, true);

    wgc::log::init(argv[0]);

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    try {
        if (command == "build-graph") {
            return run_build();
        }
        if (command == "centrality") {
            return run_centrality();
        }
        return usage_error("unknown subcommand '" + command + "'");
    } catch (const wgc::ValueError& e) {
        LOG(ERROR) << e.what();
        return EXIT_CODE_USAGE;
    } catch (const wgc::Exception& e) {
        LOG(ERROR) << e.what();
        return EXIT_CODE_ERROR;
    } catch (const std::exception& e) {
        LOG(ERROR) << "unexpected error: " << e.what();
        return EXIT_CODE_ERROR;
    }
}
