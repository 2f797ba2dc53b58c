#include <packops-cpp/node.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string>

using namespace packops_cpp;

// -- Construction and kinds ---------------------------------------------------

TEST(Node, default_is_null) {
    const auto n = Node{};
    EXPECT_TRUE(n.is_null());
    EXPECT_EQ(n.kind(), NodeKind::null);
}

TEST(Node, scalar_constructors_pick_the_right_kind) {
    EXPECT_EQ(Node{true}.kind(), NodeKind::boolean);
    EXPECT_EQ(Node{42}.kind(), NodeKind::integer);
    EXPECT_EQ(Node{std::int64_t{42}}.kind(), NodeKind::integer);
    EXPECT_EQ(Node{1.5}.kind(), NodeKind::real);
    EXPECT_EQ(Node{"text"}.kind(), NodeKind::string);
    EXPECT_EQ(Node{std::string{"text"}}.kind(), NodeKind::string);
    EXPECT_EQ(Node{Sequence{}}.kind(), NodeKind::sequence);
    EXPECT_EQ(Node{Mapping{}}.kind(), NodeKind::mapping);
}

TEST(NodeKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(NodeKind::null),     "null");
    EXPECT_EQ(to_string_view(NodeKind::boolean),  "boolean");
    EXPECT_EQ(to_string_view(NodeKind::integer),  "integer");
    EXPECT_EQ(to_string_view(NodeKind::real),     "real");
    EXPECT_EQ(to_string_view(NodeKind::string),   "string");
    EXPECT_EQ(to_string_view(NodeKind::sequence), "sequence");
    EXPECT_EQ(to_string_view(NodeKind::mapping),  "mapping");
}

TEST(Node, typed_access_on_wrong_kind_throws_type_mismatch) {
    const auto n = Node{"text"};
    try {
        (void)n.as_integer();
        FAIL() << "expected an exception";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::type_mismatch);
    }
}

TEST(Node, as_number_widens_integers) {
    EXPECT_DOUBLE_EQ(Node{3}.as_number(), 3.0);
    EXPECT_DOUBLE_EQ(Node{0.25}.as_number(), 0.25);
}

TEST(Node, schema_type_names) {
    EXPECT_EQ(schema_type_name(Node{}), "null");
    EXPECT_EQ(schema_type_name(Node{false}), "boolean");
    EXPECT_EQ(schema_type_name(Node{1}), "integer");
    EXPECT_EQ(schema_type_name(Node{1.5}), "number");
    EXPECT_EQ(schema_type_name(Node{"s"}), "string");
    EXPECT_EQ(schema_type_name(Node{Sequence{}}), "array");
    EXPECT_EQ(schema_type_name(Node{Mapping{}}), "object");
}

// -- Mapping ------------------------------------------------------------------

TEST(Mapping, preserves_insertion_order) {
    auto map = Mapping{};
    map.set("zeta", 1);
    map.set("alpha", 2);
    map.set("mid", 3);

    const auto keys = map.keys();
    ASSERT_EQ(keys.size(), 3u);
    EXPECT_EQ(keys[0], "zeta");
    EXPECT_EQ(keys[1], "alpha");
    EXPECT_EQ(keys[2], "mid");
}

TEST(Mapping, set_replaces_in_place) {
    auto map = Mapping{{"a", 1}, {"b", 2}};
    EXPECT_FALSE(map.set("a", 10));
    EXPECT_TRUE(map.set("c", 3));

    EXPECT_EQ(map.keys().front(), "a");
    EXPECT_EQ(map.at("a"), Node{10});
    EXPECT_EQ(map.size(), 3u);
}

TEST(Mapping, erase_reports_presence) {
    auto map = Mapping{{"a", 1}};
    EXPECT_TRUE(map.erase("a"));
    EXPECT_FALSE(map.erase("a"));
    EXPECT_TRUE(map.empty());
}

TEST(Mapping, at_missing_key_throws_path_not_found) {
    const auto map = Mapping{{"a", 1}};
    try {
        (void)map.at("b");
        FAIL() << "expected an exception";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::path_not_found);
    }
}

TEST(Mapping, equality_ignores_key_order) {
    const auto a = Mapping{{"x", 1}, {"y", 2}};
    const auto b = Mapping{{"y", 2}, {"x", 1}};
    EXPECT_EQ(a, b);
    EXPECT_NE(a, (Mapping{{"x", 1}}));
}

// -- Equality -----------------------------------------------------------------

TEST(Node, integers_and_reals_compare_numerically) {
    EXPECT_EQ(Node{1}, Node{1.0});
    EXPECT_NE(Node{1}, Node{1.5});
}

TEST(Node, nan_equals_nan) {
    const auto nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_EQ(Node{nan}, Node{nan});
    EXPECT_NE(Node{nan}, Node{0.0});
    EXPECT_NE(Node{1}, Node{nan});
    const auto doc = Node{Mapping{{"confidence", nan}}};
    EXPECT_EQ(doc, doc.clone());
}

TEST(Node, different_kinds_are_not_equal) {
    EXPECT_NE(Node{"1"}, Node{1});
    EXPECT_NE(Node{}, Node{false});
    EXPECT_NE(Node{Sequence{}}, Node{Mapping{}});
}

TEST(Node, nested_structural_equality) {
    const auto a = Node{Mapping{{"items", Sequence{"a", Mapping{{"k", true}}}}}};
    const auto b = Node{Mapping{{"items", Sequence{"a", Mapping{{"k", true}}}}}};
    const auto c = Node{Mapping{{"items", Sequence{Mapping{{"k", true}}, "a"}}}};
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

// -- Copy-on-write ------------------------------------------------------------

TEST(Node, copies_share_storage_until_mutated) {
    auto original = Node{Mapping{{"list", Sequence{1, 2}}}};
    auto copy = original;
    EXPECT_TRUE(copy.shares_storage_with(original));

    copy.mapping_mut().set("extra", true);

    EXPECT_FALSE(copy.shares_storage_with(original));
    EXPECT_FALSE(original.as_mapping().contains("extra"));
    EXPECT_TRUE(copy.as_mapping().contains("extra"));
}

TEST(Node, nested_mutation_does_not_leak_into_original) {
    const auto original = Node{Mapping{{"list", Sequence{1, 2}}}};
    auto copy = original;
    copy.mapping_mut().at("list").sequence_mut().push_back(3);

    EXPECT_EQ(original.at("list").size(), 2u);
    EXPECT_EQ(copy.at("list").size(), 3u);
}

TEST(Node, clone_shares_no_storage) {
    const auto original = Node{Mapping{{"list", Sequence{1, 2}}}};
    const auto deep = original.clone();

    EXPECT_EQ(deep, original);
    EXPECT_FALSE(deep.shares_storage_with(original));
    EXPECT_FALSE(deep.at("list").shares_storage_with(original.at("list")));
}

TEST(Node, scalars_never_share_storage) {
    const auto a = Node{"x"};
    const auto b = a;
    EXPECT_FALSE(a.shares_storage_with(b));
}

// -- Navigation ---------------------------------------------------------------

TEST(Node, find_and_at) {
    const auto doc = Node{Mapping{{"list", Sequence{"a", "b"}}}};
    ASSERT_NE(doc.find("list"), nullptr);
    EXPECT_EQ(doc.find("missing"), nullptr);
    EXPECT_EQ(doc.at("list").at(std::size_t{1}), Node{"b"});
    EXPECT_EQ(Node{5}.find("x"), nullptr);
}

TEST(Node, at_index_out_of_range_throws) {
    const auto seq = Node{Sequence{1}};
    try {
        (void)seq.at(std::size_t{3});
        FAIL() << "expected an exception";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::index_out_of_bounds);
    }
}

TEST(Node, size_of_scalars_is_zero) {
    EXPECT_EQ(Node{"abc"}.size(), 0u);
    EXPECT_EQ((Node{Sequence{1, 2, 3}}.size()), 3u);
}
