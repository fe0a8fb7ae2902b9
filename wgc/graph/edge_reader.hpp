#pragma once

#include "wgc/core/type.hpp"
#include "wgc/core/error.hpp"

#include <cstdint>
#include <fstream>
#include <istream>
#include <memory>
#include <string>
#include <string_view>

// =============================================================================
// FILE: wgc/graph/edge_reader.hpp
// BRIEF: Streaming parser for `source<TAB>target` edge lists
// =============================================================================

namespace wgc::graph {

/// One parsed record. Views stay valid until the next call to next().
struct RawEdge {
    std::string_view source;
    std::string_view target;
    std::uint64_t line = 0;
};

/// @brief Line-oriented edge stream.
///
/// Fields are separated by runs of tabs or spaces. Blank lines and lines
/// whose first non-blank character is '#' are skipped. Any other line must
/// hold exactly two fields, otherwise MalformedEdgeError is raised with the
/// line number and the offending record.
class EdgeReader {
public:
    /// @throws FileNotFoundError if `path` cannot be opened
    explicit EdgeReader(const std::string& path);

    /// Reads from a caller-owned stream.
    explicit EdgeReader(std::istream& in);

    EdgeReader(const EdgeReader&) = delete;
    EdgeReader& operator=(const EdgeReader&) = delete;

    /// @return false at end of input
    bool next(RawEdge& out);

    [[nodiscard]] std::uint64_t line_number() const noexcept { return line_no_; }
    [[nodiscard]] std::uint64_t records_read() const noexcept { return records_; }
    [[nodiscard]] const std::string& source_name() const noexcept { return name_; }

private:
    std::unique_ptr<std::ifstream> owned_;
    std::istream* in_ = nullptr;
    std::string name_;
    std::string line_;
    std::uint64_t line_no_ = 0;
    std::uint64_t records_ = 0;
};

} // namespace wgc::graph
