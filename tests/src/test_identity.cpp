// =============================================================================
// WGC - Node Identity Table Tests
// =============================================================================
//
// Coverage for wgc/graph/identity.hpp
//   NodeIdentityTable: intern, find, resolve, save, load
//   MappedIdentityView: resolve over saved files
//
// =============================================================================

#include "test.hpp"

#include "wgc/graph/identity.hpp"
#include "wgc/io/file.hpp"

#include <cstdint>
#include <string>

using namespace wgc;
using namespace wgc::test;

WGC_TEST_BEGIN

WGC_TEST_SUITE(intern)

WGC_TEST_CASE(assigns_first_seen_order) {
    graph::NodeIdentityTable ids;
    WGC_ASSERT_EQ(ids.intern("https://a.example/"), NodeId(0));
    WGC_ASSERT_EQ(ids.intern("https://b.example/"), NodeId(1));
    WGC_ASSERT_EQ(ids.intern("https://a.example/"), NodeId(0));
    WGC_ASSERT_EQ(ids.intern("https://c.example/"), NodeId(2));
    WGC_ASSERT_EQ(ids.size(), Size(3));
}

WGC_TEST_CASE(empty_identifier_is_malformed) {
    graph::NodeIdentityTable ids;
    WGC_ASSERT_THROWS(ids.intern(""), MalformedEdgeError);
    WGC_ASSERT_TRUE(ids.empty());
}

WGC_TEST_CASE(find_does_not_intern) {
    graph::NodeIdentityTable ids;
    ids.intern("x");
    WGC_ASSERT_TRUE(ids.find("x").has_value());
    WGC_ASSERT_EQ(*ids.find("x"), NodeId(0));
    WGC_ASSERT_FALSE(ids.find("y").has_value());
    WGC_ASSERT_EQ(ids.size(), Size(1));
}

WGC_TEST_CASE(keys_survive_growth) {
    graph::NodeIdentityTable ids;
    for (int i = 0; i < 5000; ++i) {
        ids.intern("doc-" + std::to_string(i));
    }
    for (int i = 0; i < 5000; i += 97) {
        const auto found = ids.find("doc-" + std::to_string(i));
        WGC_ASSERT_TRUE(found.has_value());
        WGC_ASSERT_EQ(*found, static_cast<NodeId>(i));
    }
}

WGC_TEST_SUITE_END

WGC_TEST_SUITE(resolve)

WGC_TEST_CASE(inverse_of_intern) {
    graph::NodeIdentityTable ids;
    const NodeId a = ids.intern("alpha");
    const NodeId b = ids.intern("beta");
    WGC_ASSERT_STR_EQ("alpha", std::string(ids.resolve(a)));
    WGC_ASSERT_STR_EQ("beta", std::string(ids.resolve(b)));
}

WGC_TEST_CASE(out_of_range_is_unknown_node) {
    graph::NodeIdentityTable ids;
    ids.intern("only");
    WGC_ASSERT_THROWS((void)ids.resolve(1), UnknownNodeError);
    WGC_ASSERT_THROWS((void)ids.resolve(0xFFFFFFFFu), UnknownNodeError);
}

WGC_TEST_SUITE_END

WGC_TEST_SUITE(persistence)

WGC_TEST_CASE(save_then_load_preserves_ids) {
    TempDir dir("ids");
    {
        graph::NodeIdentityTable ids;
        ids.intern("one");
        ids.intern("two with spaces");
        ids.intern("\xE2\x9C\x93 utf8");
        ids.save(dir.path());
    }
    const auto loaded = graph::NodeIdentityTable::load(dir.path());
    WGC_ASSERT_EQ(loaded.size(), Size(3));
    WGC_ASSERT_STR_EQ("two with spaces", std::string(loaded.resolve(1)));
    WGC_ASSERT_EQ(*loaded.find("\xE2\x9C\x93 utf8"), NodeId(2));
}

WGC_TEST_CASE(mapped_view_matches_table) {
    TempDir dir("ids");
    graph::NodeIdentityTable ids;
    for (int i = 0; i < 100; ++i) {
        ids.intern("page/" + std::to_string(i * 7));
    }
    ids.save(dir.path());

    const graph::MappedIdentityView view(dir.path());
    WGC_ASSERT_EQ(view.size(), ids.size());
    for (NodeId i = 0; i < 100; ++i) {
        WGC_ASSERT_TRUE(view.resolve(i) == ids.resolve(i));
    }
    WGC_ASSERT_THROWS((void)view.resolve(100), UnknownNodeError);
}

WGC_TEST_CASE(empty_table_round_trips) {
    TempDir dir("ids");
    graph::NodeIdentityTable().save(dir.path());
    WGC_ASSERT_EQ(graph::NodeIdentityTable::load(dir.path()).size(), Size(0));
    WGC_ASSERT_EQ(graph::MappedIdentityView(dir.path()).size(), Size(0));
}

WGC_TEST_CASE(missing_files_are_reported) {
    TempDir dir("ids");
    WGC_ASSERT_THROWS(graph::NodeIdentityTable::load(dir.path()), FileNotFoundError);
}

WGC_TEST_CASE(duplicate_identifiers_are_rejected) {
    TempDir dir("ids");
    {
        io::BinaryWriter bytes(dir.sub(graph::IDS_FILE));
        bytes.write_bytes("abab", 4);
        bytes.close();
        const std::uint64_t offsets[] = {0, 2, 4};
        io::BinaryWriter off(dir.sub(graph::ID_OFFSETS_FILE));
        off.write(offsets, 3);
        off.close();
    }
    WGC_ASSERT_THROWS(graph::NodeIdentityTable::load(dir.path()), ReadError);
}

WGC_TEST_SUITE_END

WGC_TEST_END

WGC_TEST_MAIN()
