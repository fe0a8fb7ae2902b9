#include "wgc/graph/edge_reader.hpp"

#include <array>

namespace wgc::graph {

namespace {

constexpr bool is_blank(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\r';
}

// Splits on blank runs. Returns the field count, which may exceed the
// capacity of `fields` (extra fields are counted, not stored).
Size split_fields(std::string_view line, std::array<std::string_view, 2>& fields) noexcept {
    Size count = 0;
    Size i = 0;
    while (i < line.size()) {
        while (i < line.size() && is_blank(line[i])) ++i;
        if (i == line.size()) break;
        const Size start = i;
        while (i < line.size() && !is_blank(line[i])) ++i;
        if (count < fields.size()) {
            fields[count] = line.substr(start, i - start);
        }
        ++count;
    }
    return count;
}

} // anonymous namespace

EdgeReader::EdgeReader(const std::string& path)
    : owned_(std::make_unique<std::ifstream>(path, std::ios::binary)), name_(path) {
    if (!owned_->is_open()) {
        throw FileNotFoundError(path);
    }
    in_ = owned_.get();
}

EdgeReader::EdgeReader(std::istream& in) : in_(&in), name_("<stream>") {}

bool EdgeReader::next(RawEdge& out) {
    while (std::getline(*in_, line_)) {
        ++line_no_;

        std::string_view view(line_);
        Size first = 0;
        while (first < view.size() && is_blank(view[first])) ++first;
        if (first == view.size() || view[first] == '#') {
            continue;
        }

        std::array<std::string_view, 2> fields{};
        const Size count = split_fields(view, fields);
        if (count != 2) {
            std::string record(view);
            while (!record.empty() && record.back() == '\r') record.pop_back();
            throw MalformedEdgeError(name_ + ":" + std::to_string(line_no_) +
                                     ": expected 2 fields, found " + std::to_string(count) +
                                     " in \"" + record + "\"");
        }

        out.source = fields[0];
        out.target = fields[1];
        out.line = line_no_;
        ++records_;
        return true;
    }

    if (in_->bad()) {
        throw ReadError("Failed reading edges from " + name_ + " after line " +
                        std::to_string(line_no_));
    }
    return false;
}

} // namespace wgc::graph
