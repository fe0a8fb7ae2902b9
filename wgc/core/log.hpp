#pragma once

#include <glog/logging.h>

// =============================================================================
// FILE: wgc/core/log.hpp
// BRIEF: Logging bootstrap (glog)
//
// Library code logs through glog's LOG/VLOG streams directly. Executables call
// wgc::log::init() once before doing any work; calling it again is harmless.
// =============================================================================

namespace wgc::log {

/// @brief Initialize glog for this process.
///
/// @param program_name argv[0], used by glog to name log files
/// @param to_stderr    mirror every message to stderr instead of log files
void init(const char* program_name, bool to_stderr = true);

} // namespace wgc::log
