// =============================================================================
// FILE: wgc/binding/c_api/webgraph.cpp
// BRIEF: C ABI implementation for graph construction and centrality
// =============================================================================

#include "wgc/binding/c_api/webgraph.h"
#include "wgc/binding/c_api/internal.hpp"
#include "wgc/config.hpp"
#include "wgc/engine/pipeline.hpp"

using namespace wgc;

namespace {

engine::EngineConfig to_engine_config(const wgc_centrality_options_t& opts, const char* checkpoint_dir) {
    engine::EngineConfig config;
    if (opts.precision != 0) {
        config.precision = opts.precision;
    } else if (opts.target_error > 0.0) {
        config.with_target_error(opts.target_error);
    }
    config.max_rounds = opts.max_rounds;
    config.convergence_fraction = opts.convergence_fraction;
    WGC_CHECK_ARG(opts.direction == WGC_DIRECTION_INBOUND || opts.direction == WGC_DIRECTION_OUTBOUND,
                  "wgc_compute_centrality: unknown direction " + std::to_string(opts.direction));
    config.direction = opts.direction == WGC_DIRECTION_OUTBOUND ? engine::Direction::Outbound
                                                                : engine::Direction::Inbound;
    config.seed = opts.seed;
    config.keep_checkpoints = opts.keep_checkpoints;
    config.checkpoint_dir = checkpoint_dir ? checkpoint_dir : "";
    return config;
}

} // anonymous namespace

extern "C" {

WGC_C_EXPORT void wgc_build_options_init(wgc_build_options_t* options) {
    if (!options) {
        return;
    }
    const graph::BuildConfig defaults;
    options->max_buffered_edges = defaults.max_buffered_edges;
    options->reuse_identities = defaults.reuse_identities ? WGC_TRUE : WGC_FALSE;
}

WGC_C_EXPORT void wgc_centrality_options_init(wgc_centrality_options_t* options) {
    if (!options) {
        return;
    }
    const engine::EngineConfig defaults;
    const engine::ScoreOptions scores;
    options->precision = defaults.precision;
    options->target_error = 0.0;
    options->max_rounds = defaults.max_rounds;
    options->convergence_fraction = defaults.convergence_fraction;
    options->direction = defaults.direction == engine::Direction::Outbound ? WGC_DIRECTION_OUTBOUND
                                                                            : WGC_DIRECTION_INBOUND;
    options->seed = defaults.seed;
    options->keep_checkpoints = defaults.keep_checkpoints;
    options->fresh = WGC_FALSE;
    options->normalize = scores.normalize ? WGC_TRUE : WGC_FALSE;
    options->top_k = scores.top_k;
    options->threads = 0;
}

WGC_C_EXPORT wgc_error_t wgc_build_graph(
    const char* edges_path,
    const char* graph_dir,
    const wgc_build_options_t* options,
    uint32_t* out_version,
    uint64_t* out_num_nodes,
    uint64_t* out_num_edges) {

    WGC_C_API_CHECK_NULL(edges_path, "Edge file path is null");
    WGC_C_API_CHECK_NULL(graph_dir, "Graph directory is null");

    WGC_C_API_TRY
        engine::BuildRequest request;
        request.edges_path = edges_path;
        request.graph_dir = graph_dir;
        if (options) {
            request.build.max_buffered_edges = options->max_buffered_edges;
            request.build.reuse_identities = options->reuse_identities != WGC_FALSE;
        }

        const engine::BuildSummary summary = engine::build_graph(request);

        if (out_version) {
            *out_version = summary.version;
        }
        if (out_num_nodes) {
            *out_num_nodes = static_cast<uint64_t>(summary.num_nodes);
        }
        if (out_num_edges) {
            *out_num_edges = static_cast<uint64_t>(summary.num_edges);
        }
        WGC_C_API_RETURN_OK;
    WGC_C_API_CATCH
}

WGC_C_EXPORT wgc_error_t wgc_compute_centrality(
    const char* graph_dir,
    const char* checkpoint_dir,
    const char* output_path,
    const wgc_centrality_options_t* options,
    uint32_t* out_rounds) {

    WGC_C_API_CHECK_NULL(graph_dir, "Graph directory is null");
    WGC_C_API_CHECK_NULL(output_path, "Output path is null");

    WGC_C_API_TRY
        wgc_centrality_options_t opts;
        if (options) {
            opts = *options;
        } else {
            wgc_centrality_options_init(&opts);
        }

        engine::CentralityRequest request;
        request.graph_dir = graph_dir;
        request.output_path = output_path;
        request.engine = to_engine_config(opts, checkpoint_dir);
        request.scores.normalize = opts.normalize != WGC_FALSE;
        request.scores.top_k = opts.top_k;
        request.fresh = opts.fresh != WGC_FALSE;
        request.threads = opts.threads;

        const engine::CentralitySummary summary = engine::compute_centrality(request);
        if (out_rounds) {
            *out_rounds = summary.rounds;
        }
        if (!summary.completed) {
            throw IncompleteRunError("wgc_compute_centrality: stopped after round " +
                                     std::to_string(summary.rounds));
        }
        WGC_C_API_RETURN_OK;
    WGC_C_API_CATCH
}

} // extern "C"
