#pragma once

#include "wgc/config.hpp"
#include "wgc/core/type.hpp"
#include "wgc/core/error.hpp"
#include "wgc/kernel/harmonic.hpp"
#include "wgc/sketch/hyperloglog.hpp"

#include <cmath>
#include <cstdint>
#include <string>

// =============================================================================
// FILE: wgc/engine/config.hpp
// BRIEF: Run configuration for the centrality engine
// =============================================================================

namespace wgc::engine {

using Direction = kernel::harmonic::Direction;
using kernel::harmonic::parse_direction;
using kernel::harmonic::to_string;

struct EngineConfig {
    // HyperLogLog precision p; each sketch has 2^p registers.
    int precision = sketch::config::DEFAULT_PRECISION;

    std::uint32_t max_rounds = config::DEFAULT_MAX_ROUNDS;

    // Stop once a round's total new reachability is below this fraction of N.
    double convergence_fraction = config::DEFAULT_CONVERGENCE_FRACTION;

    Direction direction = Direction::Inbound;

    std::uint64_t seed = sketch::config::DEFAULT_SEED;

    // Empty disables checkpointing.
    std::string checkpoint_dir;

    Size keep_checkpoints = config::DEFAULT_KEEP_CHECKPOINTS;

    // Pick up from the latest checkpoint when one exists.
    bool resume = true;

    /// Precision chosen from a target relative standard error.
    EngineConfig& with_target_error(double rse) {
        precision = sketch::hll::precision_for_error(rse);
        return *this;
    }

    /// @throws RangeError / ValueError
    void validate() const {
        sketch::hll::check_precision(precision);
        WGC_CHECK_ARG(max_rounds >= 1, "EngineConfig: max_rounds must be at least 1");
        WGC_CHECK_ARG(std::isfinite(convergence_fraction) && convergence_fraction >= 0.0,
                      "EngineConfig: convergence_fraction must be a non-negative number");
        WGC_CHECK_ARG(keep_checkpoints >= 1, "EngineConfig: keep_checkpoints must be at least 1");
    }
};

} // namespace wgc::engine
