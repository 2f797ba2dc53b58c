#include <packops-cpp/yaml.hpp>

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>

using namespace packops_cpp;

namespace {

auto scalar(const std::string& text) -> Node {
    return parse_yaml("value: " + text + "\n").at("value");
}

void expect_parse_error(const std::string& text) {
    try {
        (void)parse_yaml(text);
        FAIL() << "expected a parse error for:\n" << text;
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::parse_error);
    }
}

}  // anonymous namespace

// =============================================================================
// Scalar typing
// =============================================================================

TEST(YamlScalar, plain_scalars_follow_the_core_schema) {
    EXPECT_TRUE(scalar("~").is_null());
    EXPECT_TRUE(scalar("null").is_null());
    EXPECT_TRUE(scalar("").is_null());
    EXPECT_EQ(scalar("true"), Node{true});
    EXPECT_EQ(scalar("False"), Node{false});
    EXPECT_EQ(scalar("42"), Node{42});
    EXPECT_EQ(scalar("-7"), Node{-7});
    EXPECT_EQ(scalar("0x1F"), Node{31});
    EXPECT_EQ(scalar("0o17"), Node{15});
    EXPECT_TRUE(scalar("1.5").is_real());
    EXPECT_DOUBLE_EQ(scalar("1e3").as_real(), 1000.0);
    EXPECT_TRUE(std::isinf(scalar("-.inf").as_real()));
    EXPECT_TRUE(std::isnan(scalar(".nan").as_real()));
}

TEST(YamlScalar, yaml_1_1_spellings_stay_strings) {
    EXPECT_EQ(scalar("yes"), Node{"yes"});
    EXPECT_EQ(scalar("off"), Node{"off"});
    EXPECT_EQ(scalar("1.0.0"), Node{"1.0.0"});
    EXPECT_EQ(scalar("012abc"), Node{"012abc"});
}

TEST(YamlScalar, quoted_scalars_are_strings) {
    EXPECT_EQ(scalar("\"42\""), Node{"42"});
    EXPECT_EQ(scalar("'true'"), Node{"true"});
    EXPECT_EQ(scalar("''"), Node{""});
}

TEST(YamlScalar, explicit_tags) {
    EXPECT_EQ(scalar("!!str 42"), Node{"42"});
    EXPECT_EQ(scalar("!!float 3"), Node{3.0});
    EXPECT_TRUE(scalar("!!float 3").is_real());
    EXPECT_EQ(scalar("!!int 0x10"), Node{16});
    expect_parse_error("value: !!int abc\n");
}

// =============================================================================
// Documents
// =============================================================================

TEST(ParseYaml, nested_document_keeps_key_order) {
    const auto doc = parse_yaml(
        "name: Legal\n"
        "version: 1.0.0\n"
        "key_terms:\n"
        "  - contract\n"
        "  - tort\n"
        "entities:\n"
        "  - name: Attorney\n"
        "    attributes: [name, bar_number]\n");

    const auto keys = doc.as_mapping().keys();
    ASSERT_EQ(keys.size(), 4u);
    EXPECT_EQ(keys[0], "name");
    EXPECT_EQ(keys[3], "entities");
    EXPECT_EQ(doc.at("key_terms"), (Node{Sequence{"contract", "tort"}}));
    EXPECT_EQ(doc.at("entities").at(std::size_t{0}).at("attributes"),
              (Node{Sequence{"name", "bar_number"}}));
}

TEST(ParseYaml, empty_content_is_an_error) {
    expect_parse_error("");
    expect_parse_error("# only a comment\n");
    expect_parse_error("~\n");
}

TEST(ParseYaml, malformed_text_is_an_error) {
    expect_parse_error("key: [unclosed\n");
    expect_parse_error("key: [1, 2\n");
    expect_parse_error("a: b: c\n");
}

TEST(ParseYaml, very_long_scalars_are_resolved) {
    const auto digits = std::string(200000, '7');

    // Beyond the range of a double, the digits are kept as text.
    const auto plain = parse_yaml("description: " + digits + "\n").at("description");
    EXPECT_EQ(plain, Node{digits});

    const auto quoted = parse_yaml("description: '" + digits + "'\n").at("description");
    EXPECT_EQ(quoted, Node{digits});

    const auto text = std::string(200000, 'a');
    EXPECT_EQ(parse_yaml("description: " + text + "\n").at("description"), Node{text});
}

TEST(SerializeYaml, very_long_numeric_string_round_trips) {
    const auto digits = std::string(200000, '7');
    const auto doc = Node{Mapping{{"description", digits}}};
    EXPECT_EQ(parse_yaml(serialize_yaml(doc)), doc);
}

TEST(ParseYaml, non_scalar_keys_are_rejected) {
    expect_parse_error("? [a, b]\n: value\n");
}

TEST(ParseYaml, scalar_root_is_returned_as_is) {
    EXPECT_EQ(parse_yaml("just text\n"), Node{"just text"});
}

// =============================================================================
// Emission
// =============================================================================

TEST(SerializeYaml, round_trip_preserves_values_and_order) {
    const auto doc = Node{Mapping{
        {"name", "Legal"},
        {"version", "1.0.0"},
        {"count", 3},
        {"ratio", 0.5},
        {"whole", 2.0},
        {"flag", true},
        {"nothing", Node{}},
        {"key_terms", Sequence{"contract", "tort"}},
        {"empty_list", Sequence{}},
        {"nested", Mapping{{"inner", Mapping{{"deep", "x"}}}}},
    }};

    const auto text = serialize_yaml(doc);
    EXPECT_EQ(text.back(), '\n');

    const auto back = parse_yaml(text);
    EXPECT_EQ(back, doc);
    EXPECT_TRUE(back.at("whole").is_real());
    EXPECT_EQ(back.as_mapping().keys(), doc.as_mapping().keys());
}

TEST(SerializeYaml, strings_that_look_typed_are_quoted) {
    const auto doc = Node{Mapping{
        {"a", "true"},
        {"b", "42"},
        {"c", "null"},
        {"d", ""},
        {"e", "1.5"},
    }};
    const auto text = serialize_yaml(doc);
    EXPECT_NE(text.find("\"true\""), std::string::npos);
    EXPECT_NE(text.find("\"42\""), std::string::npos);
    EXPECT_NE(text.find("\"null\""), std::string::npos);
    EXPECT_NE(text.find("\"\""), std::string::npos);
    EXPECT_EQ(parse_yaml(text), doc);
}

TEST(SerializeYaml, plain_strings_stay_plain) {
    const auto text = serialize_yaml(Node{Mapping{{"name", "Legal"}}});
    EXPECT_EQ(text, "name: Legal\n");
}

TEST(SerializeYaml, special_characters_survive) {
    const auto doc = Node{Mapping{
        {"colon", "a: b"},
        {"hash", "# not a comment"},
        {"multi", "line one\nline two"},
        {"unicode", "caf\xC3\xA9"},
    }};
    EXPECT_EQ(parse_yaml(serialize_yaml(doc)), doc);
}

TEST(SerializeYaml, special_reals) {
    const auto doc = Node{Mapping{{"inf", std::numeric_limits<double>::infinity()}}};
    const auto back = parse_yaml(serialize_yaml(doc));
    EXPECT_TRUE(std::isinf(back.at("inf").as_real()));
}
