// =============================================================================
// WGC - Edge Reader Tests
// =============================================================================

#include "test.hpp"

#include "wgc/graph/edge_reader.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace wgc;
using namespace wgc::test;

namespace {

std::vector<NamedEdge> read_all(graph::EdgeReader& reader) {
    std::vector<NamedEdge> out;
    graph::RawEdge e;
    while (reader.next(e)) {
        out.emplace_back(std::string(e.source), std::string(e.target));
    }
    return out;
}

} // namespace

WGC_TEST_BEGIN

WGC_TEST_UNIT(parses_tab_separated_records) {
    std::istringstream in("a\tb\nb\tc\n");
    graph::EdgeReader reader(in);
    const auto edges = read_all(reader);
    WGC_ASSERT_EQ(edges.size(), Size(2));
    WGC_ASSERT_STR_EQ("a", edges[0].first);
    WGC_ASSERT_STR_EQ("c", edges[1].second);
    WGC_ASSERT_EQ(reader.records_read(), std::uint64_t(2));
}

WGC_TEST_UNIT(skips_blank_and_comment_lines) {
    std::istringstream in("# header\n\n   \na b\n  # indented comment\r\nc\td\r\n");
    graph::EdgeReader reader(in);
    const auto edges = read_all(reader);
    WGC_ASSERT_EQ(edges.size(), Size(2));
    WGC_ASSERT_STR_EQ("d", edges[1].second);
    WGC_ASSERT_EQ(reader.line_number(), std::uint64_t(6));
}

WGC_TEST_UNIT(tolerates_repeated_separators) {
    std::istringstream in("x \t  y\n");
    graph::EdgeReader reader(in);
    const auto edges = read_all(reader);
    WGC_ASSERT_EQ(edges.size(), Size(1));
    WGC_ASSERT_STR_EQ("x", edges[0].first);
    WGC_ASSERT_STR_EQ("y", edges[0].second);
}

WGC_TEST_UNIT(single_field_is_malformed) {
    std::istringstream in("a\tb\nlonely\n");
    graph::EdgeReader reader(in);
    graph::RawEdge e;
    WGC_ASSERT_TRUE(reader.next(e));
    try {
        reader.next(e);
        WGC_FAIL("expected MalformedEdgeError");
    } catch (const MalformedEdgeError& err) {
        const std::string msg = err.what();
        WGC_ASSERT_STR_CONTAINS(msg, ":2:");
        WGC_ASSERT_STR_CONTAINS(msg, "lonely");
        WGC_ASSERT_EQ(err.code(), ErrorCode::MALFORMED_EDGE);
    }
}

WGC_TEST_UNIT(three_fields_is_malformed) {
    std::istringstream in("a b c\n");
    graph::EdgeReader reader(in);
    graph::RawEdge e;
    WGC_ASSERT_THROWS(reader.next(e), MalformedEdgeError);
}

WGC_TEST_UNIT(missing_file_is_reported) {
    TempDir dir("edges");
    WGC_ASSERT_THROWS(graph::EdgeReader(dir.sub("nope.tsv")), FileNotFoundError);
}

WGC_TEST_UNIT(reads_from_file) {
    TempDir dir("edges");
    write_edge_file(dir.sub("e.tsv"), {{"p1", "p2"}, {"p2", "p3"}});
    graph::EdgeReader reader(dir.sub("e.tsv"));
    const auto edges = read_all(reader);
    WGC_ASSERT_EQ(edges.size(), Size(2));
    WGC_ASSERT_STR_EQ(dir.sub("e.tsv"), reader.source_name());
}

WGC_TEST_END

WGC_TEST_MAIN()
