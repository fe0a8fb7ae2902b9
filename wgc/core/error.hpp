#pragma once

#include "wgc/core/macros.hpp"

#include <cstdint>
#include <exception>
#include <string>
#include <utility>

// =============================================================================
// FILE: wgc/core/error.hpp
// BRIEF: Exception hierarchy and argument-check macros
// =============================================================================
//
// Every library failure is a wgc::Exception carrying an ErrorCode. The codes
// are part of the C ABI (wgc/binding/c_api/core.h repeats them as macros), so
// values are never renumbered.
// =============================================================================

namespace wgc {

enum class ErrorCode : std::int32_t {
    OK = 0,

    UNKNOWN = 1,
    INTERNAL_ERROR = 2,
    OUT_OF_MEMORY = 3,
    NULL_POINTER = 4,

    INVALID_ARGUMENT = 10,
    DIMENSION_MISMATCH = 11,
    RANGE_ERROR = 13,

    IO_ERROR = 30,
    FILE_NOT_FOUND = 31,
    READ_ERROR = 33,
    WRITE_ERROR = 34,

    OVERFLOW = 52,

    MALFORMED_EDGE = 60,
    UNKNOWN_NODE = 61,

    INCOMPLETE_RUN = 70,
    CHECKPOINT_MISMATCH = 71,
};

class WGC_EXPORT Exception : public std::exception {
public:
    Exception(ErrorCode code, std::string msg) : code_(code), msg_(std::move(msg)) {}

    const char* what() const noexcept override { return msg_.c_str(); }

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return msg_; }

private:
    ErrorCode code_;
    std::string msg_;
};

/// Broken internal invariant; never caused by input.
class InternalError : public Exception {
public:
    explicit InternalError(const std::string& msg)
        : Exception(ErrorCode::INTERNAL_ERROR, "internal error: " + msg) {}
};

/// A counter or id space ran out (node ids, edge offsets, versions).
class OverflowError : public Exception {
public:
    explicit OverflowError(const std::string& msg) : Exception(ErrorCode::OVERFLOW, msg) {}
};

// -----------------------------------------------------------------------------
// Argument errors
// -----------------------------------------------------------------------------

class ValueError : public Exception {
public:
    explicit ValueError(const std::string& msg) : Exception(ErrorCode::INVALID_ARGUMENT, msg) {}

protected:
    ValueError(ErrorCode code, const std::string& msg) : Exception(code, msg) {}
};

/// Two arrays that must agree in length do not.
class DimensionError : public ValueError {
public:
    explicit DimensionError(const std::string& msg) : ValueError(ErrorCode::DIMENSION_MISMATCH, msg) {}
};

class RangeError : public ValueError {
public:
    explicit RangeError(const std::string& msg) : ValueError(ErrorCode::RANGE_ERROR, msg) {}
};

// -----------------------------------------------------------------------------
// I/O errors
// -----------------------------------------------------------------------------

class IOError : public Exception {
public:
    explicit IOError(const std::string& msg) : Exception(ErrorCode::IO_ERROR, msg) {}

protected:
    IOError(ErrorCode code, const std::string& msg) : Exception(code, msg) {}
};

class FileNotFoundError : public IOError {
public:
    explicit FileNotFoundError(const std::string& path)
        : IOError(ErrorCode::FILE_NOT_FOUND, "no such file: " + path) {}
};

/// Stored data is unreadable or inconsistent (truncated arrays, bad pointer files).
class ReadError : public IOError {
public:
    explicit ReadError(const std::string& msg) : IOError(ErrorCode::READ_ERROR, msg) {}
};

class WriteError : public IOError {
public:
    explicit WriteError(const std::string& msg) : IOError(ErrorCode::WRITE_ERROR, msg) {}
};

// -----------------------------------------------------------------------------
// Graph errors
// -----------------------------------------------------------------------------

/// Raw edge that cannot be compacted into a snapshot: unparsable record,
/// empty identifier, or an endpoint that was never interned.
class MalformedEdgeError : public Exception {
public:
    explicit MalformedEdgeError(const std::string& msg)
        : Exception(ErrorCode::MALFORMED_EDGE, "malformed edge: " + msg) {}
};

/// Node id outside the assigned range [0, N).
class UnknownNodeError : public Exception {
public:
    UnknownNodeError(std::uint64_t node, std::uint64_t num_nodes)
        : Exception(ErrorCode::UNKNOWN_NODE,
                    "node " + std::to_string(node) + " is outside [0, " + std::to_string(num_nodes) + ")") {}

    explicit UnknownNodeError(const std::string& msg) : Exception(ErrorCode::UNKNOWN_NODE, msg) {}
};

// -----------------------------------------------------------------------------
// Run-state errors
// -----------------------------------------------------------------------------

/// Scores requested from a run that has not reached a terminal state.
class IncompleteRunError : public Exception {
public:
    explicit IncompleteRunError(const std::string& msg) : Exception(ErrorCode::INCOMPLETE_RUN, msg) {}
};

/// Checkpoint written for a different graph or sketch configuration.
class CheckpointMismatchError : public Exception {
public:
    explicit CheckpointMismatchError(const std::string& msg)
        : Exception(ErrorCode::CHECKPOINT_MISMATCH, "checkpoint mismatch: " + msg) {}
};

// -----------------------------------------------------------------------------
// Checks
// -----------------------------------------------------------------------------

#define WGC_THROW_UNLESS(cond, ErrorType, msg) \
    do { \
        if (WGC_UNLIKELY(!(cond))) { \
            throw ErrorType(msg); \
        } \
    } while (0)

#define WGC_CHECK_ARG(cond, msg) WGC_THROW_UNLESS(cond, ::wgc::ValueError, msg)
#define WGC_CHECK_DIM(cond, msg) WGC_THROW_UNLESS(cond, ::wgc::DimensionError, msg)

#define WGC_CHECK_RANGE(value, lo, hi, msg) \
    WGC_THROW_UNLESS(!((value) < (lo) || (value) > (hi)), ::wgc::RangeError, msg)

#define WGC_CHECK_NODE(node, num_nodes) \
    do { \
        const auto wgc_node_ = static_cast<std::uint64_t>(node); \
        const auto wgc_n_ = static_cast<std::uint64_t>(num_nodes); \
        if (WGC_UNLIKELY(wgc_node_ >= wgc_n_)) { \
            throw ::wgc::UnknownNodeError(wgc_node_, wgc_n_); \
        } \
    } while (0)

} // namespace wgc
