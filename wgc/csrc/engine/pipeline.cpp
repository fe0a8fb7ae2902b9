#include "wgc/engine/pipeline.hpp"
#include "wgc/engine/checkpoint.hpp"
#include "wgc/graph/edge_reader.hpp"
#include "wgc/graph/snapshot.hpp"
#include "wgc/threading/scheduler.hpp"

#include <glog/logging.h>

namespace wgc::engine {

BuildSummary build_graph(const BuildRequest& request) {
    request.build.validate();

    graph::SnapshotStore store(request.graph_dir);
    graph::EdgeReader reader(request.edges_path);
    graph::GraphBuilder builder(store, request.build);

    LOG(INFO) << "Building graph " << store.version_name(builder.version()) << " from " << request.edges_path;
    builder.ingest(reader);
    const graph::GraphSnapshot snapshot = builder.finish();

    BuildSummary summary;
    summary.version = snapshot.version();
    summary.num_nodes = snapshot.num_nodes();
    summary.num_edges = snapshot.num_edges();
    summary.self_loops = snapshot.self_loop_count();
    summary.records_read = builder.stats().records_read;

    LOG(INFO) << "Published " << store.version_name(summary.version) << ": " << summary.num_nodes
              << " nodes, " << summary.num_edges << " edges (" << summary.self_loops << " self loops)";
    return summary;
}

CentralitySummary compute_centrality(const CentralityRequest& request) {
    request.engine.validate();
    WGC_CHECK_ARG(!request.output_path.empty(), "compute_centrality: output path is required");

    if (request.threads > 0) {
        threading::Scheduler::init(request.threads);
    }
    VLOG(1) << "Threading backend " << threading::Scheduler::backend_name() << " with "
            << threading::Scheduler::get_num_threads() << " threads";

    const graph::SnapshotStore store(request.graph_dir);
    const graph::GraphSnapshot snapshot = store.open_latest();

    if (request.engine.checkpoint_dir.empty()) {
        LOG(WARNING) << "No checkpoint_dir given; an interrupted run will start over from round 0";
    } else if (request.fresh) {
        CheckpointManager(request.engine.checkpoint_dir, request.engine.keep_checkpoints).clear();
    }

    CentralityEngine engine(snapshot, request.engine);
    engine.set_cancel_flag(request.cancel);
    const CentralityResult result = engine.run();

    CentralitySummary summary;
    summary.completed = result.terminal;
    summary.rounds = result.rounds_completed;
    summary.reason = result.reason;
    summary.graph_version = result.graph_version;
    summary.num_nodes = result.num_nodes();
    summary.resumed = result.resumed_from.has_value();
    summary.checkpointed = !request.engine.checkpoint_dir.empty();

    if (!result.terminal) {
        LOG(WARNING) << "Centrality run interrupted after round " << result.rounds_completed
                     << (request.engine.checkpoint_dir.empty() ? "; no checkpoint was kept"
                                                               : "; rerun to resume from the latest checkpoint");
        return summary;
    }

    const ScoreWriter writer(request.scores);
    summary.scores_written = writer.write(request.output_path, result, snapshot.identities());
    LOG(INFO) << "Centrality finished after " << result.rounds_completed << " rounds (" << to_string(result.reason)
              << ")";
    return summary;
}

} // namespace wgc::engine
