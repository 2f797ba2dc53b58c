#include <packops-cpp/error.hpp>

#include <gtest/gtest.h>

using namespace packops_cpp;

TEST(ErrorKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ErrorKind::invalid_input),       "invalid_input");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_path_syntax), "invalid_path_syntax");
    EXPECT_EQ(to_string_view(ErrorKind::path_not_found),      "path_not_found");
    EXPECT_EQ(to_string_view(ErrorKind::index_out_of_bounds), "index_out_of_bounds");
    EXPECT_EQ(to_string_view(ErrorKind::type_mismatch),       "type_mismatch");
    EXPECT_EQ(to_string_view(ErrorKind::key_already_exists),  "key_already_exists");
    EXPECT_EQ(to_string_view(ErrorKind::not_an_object),       "not_an_object");
    EXPECT_EQ(to_string_view(ErrorKind::assertion_failed),    "assertion_failed");
    EXPECT_EQ(to_string_view(ErrorKind::unknown_action),      "unknown_action");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_operation),   "invalid_operation");
    EXPECT_EQ(to_string_view(ErrorKind::schema_violation),    "schema_violation");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_schema),      "invalid_schema");
    EXPECT_EQ(to_string_view(ErrorKind::parse_error),         "parse_error");
    EXPECT_EQ(to_string_view(ErrorKind::serialization_error), "serialization_error");
}

TEST(ErrorKind, error_code_is_upper_case_wire_name) {
    EXPECT_EQ(error_code(ErrorKind::invalid_input),       "INVALID_INPUT");
    EXPECT_EQ(error_code(ErrorKind::invalid_path_syntax), "INVALID_PATH_SYNTAX");
    EXPECT_EQ(error_code(ErrorKind::path_not_found),      "PATH_NOT_FOUND");
    EXPECT_EQ(error_code(ErrorKind::index_out_of_bounds), "INDEX_OUT_OF_BOUNDS");
    EXPECT_EQ(error_code(ErrorKind::type_mismatch),       "TYPE_MISMATCH");
    EXPECT_EQ(error_code(ErrorKind::key_already_exists),  "KEY_ALREADY_EXISTS");
    EXPECT_EQ(error_code(ErrorKind::not_an_object),       "NOT_AN_OBJECT");
    EXPECT_EQ(error_code(ErrorKind::assertion_failed),    "ASSERTION_FAILED");
    EXPECT_EQ(error_code(ErrorKind::unknown_action),      "UNKNOWN_ACTION");
    EXPECT_EQ(error_code(ErrorKind::invalid_operation),   "INVALID_OPERATION");
    EXPECT_EQ(error_code(ErrorKind::schema_violation),    "SCHEMA_VIOLATION");
    EXPECT_EQ(error_code(ErrorKind::invalid_schema),      "INVALID_SCHEMA");
    EXPECT_EQ(error_code(ErrorKind::parse_error),         "PARSE_ERROR");
    EXPECT_EQ(error_code(ErrorKind::serialization_error), "SERIALIZATION_ERROR");
}

TEST(Error, construction_and_equality) {
    const auto e1 = Error{ErrorKind::path_not_found, "missing"};
    const auto e2 = Error{ErrorKind::path_not_found, "missing"};
    const auto e3 = Error{ErrorKind::type_mismatch, "missing"};

    EXPECT_EQ(e1, e2);
    EXPECT_NE(e1, e3);
}

TEST(Error, different_messages_are_not_equal) {
    const auto e1 = Error{ErrorKind::parse_error, "foo"};
    const auto e2 = Error{ErrorKind::parse_error, "bar"};

    EXPECT_NE(e1, e2);
}

TEST(Exception, carries_the_structured_error) {
    try {
        throw Exception{ErrorKind::assertion_failed, "Assertion failed at version"};
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "Assertion failed at version");
        const auto* ex = dynamic_cast<const Exception*>(&e);
        ASSERT_NE(ex, nullptr);
        EXPECT_EQ(ex->kind(), ErrorKind::assertion_failed);
        EXPECT_EQ(ex->error(), (Error{ErrorKind::assertion_failed, "Assertion failed at version"}));
    }
}
