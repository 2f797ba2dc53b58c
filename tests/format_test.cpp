#include <packops-cpp/format.hpp>

#include <gtest/gtest.h>

#include <string>
#include <utility>

using namespace packops_cpp;

TEST(Format, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(Format::yaml), "yaml");
    EXPECT_EQ(to_string_view(Format::json), "json");
}

TEST(ParseFormat, accepts_known_names) {
    EXPECT_EQ(parse_format("yaml"), Format::yaml);
    EXPECT_EQ(parse_format("yml"), Format::yaml);
    EXPECT_EQ(parse_format(" YAML "), Format::yaml);
    EXPECT_EQ(parse_format("Json"), Format::json);
}

TEST(ParseFormat, rejects_unknown_names) {
    EXPECT_FALSE(parse_format("xml").has_value());
    EXPECT_FALSE(parse_format("").has_value());
    EXPECT_FALSE(parse_format("ya ml").has_value());
}

TEST(DetectFormat, by_extension) {
    EXPECT_EQ(detect_format("packs/legal.yaml"), Format::yaml);
    EXPECT_EQ(detect_format("legal.YML"), Format::yaml);
    EXPECT_EQ(detect_format("ops.json"), Format::json);
    EXPECT_FALSE(detect_format("README.md").has_value());
    EXPECT_FALSE(detect_format("yaml").has_value());
}

TEST(ParseDocument, yaml_and_json) {
    const auto from_yaml = parse_document("name: Legal\nversion: 1.0.0\n", Format::yaml);
    const auto from_json = parse_document(R"({"name": "Legal", "version": "1.0.0"})", Format::json);
    EXPECT_EQ(from_yaml, from_json);
}

TEST(ParseDocument, root_must_be_a_mapping) {
    try {
        (void)parse_document("- a\n- b\n", Format::yaml);
        FAIL();
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::parse_error);
        EXPECT_STREQ(e.what(), "YAML must contain a mapping at root, got sequence");
    }
    try {
        (void)parse_document("42", Format::json);
        FAIL();
    } catch (const Exception& e) {
        EXPECT_STREQ(e.what(), "JSON must contain a mapping at root, got integer");
    }
}

TEST(ParseDocument, syntax_errors_are_parse_errors) {
    for (const auto& [text, format] : {std::pair{"{", Format::json},
                                       std::pair{"key: [", Format::yaml}}) {
        try {
            (void)parse_document(text, format);
            ADD_FAILURE() << text;
        } catch (const Exception& e) {
            EXPECT_EQ(e.kind(), ErrorKind::parse_error);
        }
    }
}

TEST(SerializeDocument, per_format) {
    const auto doc = Node{Mapping{{"name", "Legal"}, {"key_terms", Sequence{"contract"}}}};

    EXPECT_EQ(serialize_document(doc, Format::json),
              "{\n  \"name\": \"Legal\",\n  \"key_terms\": [\n    \"contract\"\n  ]\n}");

    const auto yaml = serialize_document(doc, Format::yaml);
    EXPECT_EQ(parse_document(yaml, Format::yaml), doc);
}

TEST(SerializeDocument, root_must_be_a_mapping) {
    try {
        (void)serialize_document(Node{Sequence{}}, Format::json);
        FAIL();
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::serialization_error);
        EXPECT_STREQ(e.what(), "Document must be a mapping, got sequence");
    }
}
