#pragma once

// =============================================================================
// FILE: wgc/binding/c_api/webgraph.h
// BRIEF: C ABI for graph construction and harmonic centrality
// =============================================================================
//
// Both calls are blocking. wgc_compute_centrality resumes from checkpoints
// left by an earlier interrupted run unless `fresh` is set.
// =============================================================================

#include "wgc/binding/c_api/core.h"

#ifdef __cplusplus
extern "C" {
#endif

#define WGC_DIRECTION_INBOUND 0
#define WGC_DIRECTION_OUTBOUND 1

typedef struct wgc_build_options {
    wgc_size_t max_buffered_edges;
    wgc_bool_t reuse_identities;
} wgc_build_options_t;

typedef struct wgc_centrality_options {
    // 0 selects the precision from target_error (or the default if both are 0)
    int32_t precision;
    double target_error;
    uint32_t max_rounds;
    double convergence_fraction;
    int32_t direction;
    uint64_t seed;
    wgc_size_t keep_checkpoints;
    wgc_bool_t fresh;
    wgc_bool_t normalize;
    wgc_size_t top_k;
    // 0 keeps the default thread count
    wgc_size_t threads;
} wgc_centrality_options_t;

// Fill with library defaults.
WGC_C_EXPORT void wgc_build_options_init(wgc_build_options_t* options);
WGC_C_EXPORT void wgc_centrality_options_init(wgc_centrality_options_t* options);

/// @brief Build and publish a graph snapshot from a TSV edge file
/// @param[in] edges_path  `source<TAB>target` lines
/// @param[in] graph_dir   snapshot store root
/// @param[in] options     may be NULL for defaults
/// @param[out] out_version, out_num_nodes, out_num_edges  each may be NULL
/// @return WGC_OK, WGC_ERROR_MALFORMED_EDGE, WGC_ERROR_FILE_NOT_FOUND, ...
WGC_C_EXPORT wgc_error_t wgc_build_graph(
    const char* edges_path,
    const char* graph_dir,
    const wgc_build_options_t* options,
    uint32_t* out_version,
    uint64_t* out_num_nodes,
    uint64_t* out_num_edges
);

/// @brief Score the current snapshot and write `external_id<TAB>score` lines
/// @param[in] checkpoint_dir  NULL or "" disables checkpointing
/// @param[in] options         may be NULL for defaults
/// @param[out] out_rounds     rounds completed; may be NULL
WGC_C_EXPORT wgc_error_t wgc_compute_centrality(
    const char* graph_dir,
    const char* checkpoint_dir,
    const char* output_path,
    const wgc_centrality_options_t* options,
    uint32_t* out_rounds
);

#ifdef __cplusplus
}
#endif
