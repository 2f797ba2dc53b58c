#include <packops-cpp/operation.hpp>

#include <gtest/gtest.h>

#include <limits>
#include <string>
#include <vector>

using namespace packops_cpp;

namespace {

auto minimal_document() -> Node {
    return Node{Mapping{
        {"name", "T"},
        {"description", "T"},
        {"version", "1.0.0"},
    }};
}

auto pack_document() -> Node {
    return Node{Mapping{
        {"name", "Legal"},
        {"description", "Legal domain"},
        {"version", "1.0.0"},
        {"key_terms", Sequence{"x"}},
        {"entities", Sequence{
            Mapping{{"name", "Attorney"}, {"type", "ATTORNEY"}, {"attributes", Sequence{"name"}}},
        }},
        {"business_context", Mapping{{"litigation", Sequence{"motion"}}}},
    }};
}

void expect_failure(const Node& doc, const Operation& op, ErrorKind kind,
                    const ApplyOptions& options = {}) {
    try {
        (void)apply_operation(doc, op, options);
        FAIL() << "expected " << to_string_view(kind);
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), kind) << e.what();
    }
}

}  // anonymous namespace

TEST(OpType, wire_names_round_trip) {
    for (auto type : {OpType::add, OpType::del, OpType::update, OpType::merge,
                      OpType::add_unique, OpType::assertion}) {
        EXPECT_EQ(parse_op_type(to_string_view(type)), type);
    }
    EXPECT_EQ(to_string_view(OpType::del), "delete");
    EXPECT_EQ(to_string_view(OpType::assertion), "assert");
    EXPECT_FALSE(parse_op_type("replace").has_value());
}

TEST(Operation, op_type_and_path) {
    const auto op = Operation{DeleteOp{parse_path("key_terms[0]")}};
    EXPECT_EQ(op_type(op), OpType::del);
    EXPECT_EQ(op_path(op), parse_path("key_terms[0]"));
}

// =============================================================================
// Add
// =============================================================================

TEST(Add, appends_to_existing_sequence) {
    const auto result = apply_operation(pack_document(), AddOp{parse_path("key_terms"), "y"});
    EXPECT_EQ(result.at("key_terms"), (Node{Sequence{"x", "y"}}));
}

TEST(Add, absent_key_is_set_to_the_raw_value) {
    // No wrapping: the value is stored as given, not as a one-item list.
    const auto result = apply_operation(minimal_document(), AddOp{parse_path("key_terms"), "y"});
    EXPECT_EQ(result.at("key_terms"), Node{"y"});
    EXPECT_NE(result.at("key_terms"), Node{Sequence{"y"}});
}

TEST(Add, existing_scalar_is_key_already_exists) {
    expect_failure(minimal_document(), AddOp{parse_path("version"), "2.0.0"},
                   ErrorKind::key_already_exists);
}

TEST(Add, existing_mapping_is_key_already_exists) {
    expect_failure(pack_document(), AddOp{parse_path("business_context"), Mapping{}},
                   ErrorKind::key_already_exists);
}

TEST(Add, nested_key_inside_sequence_item) {
    const auto result = apply_operation(
        pack_document(), AddOp{parse_path("entities[0].synonyms"), Sequence{"Lawyer"}});
    EXPECT_EQ(result.at("entities").at(std::size_t{0}).at("synonyms"), Node{Sequence{"Lawyer"}});
}

TEST(Add, index_equal_to_length_appends) {
    const auto result = apply_operation(pack_document(), AddOp{parse_path("key_terms[1]"), "z"});
    EXPECT_EQ(result.at("key_terms"), (Node{Sequence{"x", "z"}}));
}

TEST(Add, index_past_end_is_out_of_bounds) {
    expect_failure(pack_document(), AddOp{parse_path("key_terms[3]"), "z"},
                   ErrorKind::index_out_of_bounds);
}

TEST(Add, missing_parent_without_auto_create) {
    expect_failure(minimal_document(), AddOp{parse_path("entity_aliases.Attorney"), Sequence{}},
                   ErrorKind::path_not_found);
}

TEST(Add, missing_parent_with_auto_create) {
    const auto result = apply_operation(
        minimal_document(), AddOp{parse_path("validation_rules.entity.required"), Sequence{"name"}},
        ApplyOptions{.auto_create_paths = true});
    EXPECT_EQ(result.at("validation_rules").at("entity").at("required"), Node{Sequence{"name"}});
}

TEST(Add, key_under_scalar_is_type_mismatch) {
    expect_failure(minimal_document(), AddOp{parse_path("name.first"), "x"},
                   ErrorKind::type_mismatch);
}

TEST(Add, empty_path_is_invalid) {
    expect_failure(minimal_document(), AddOp{Path{}, "x"}, ErrorKind::invalid_operation);
}

TEST(Add, input_document_is_not_modified) {
    const auto doc = pack_document();
    const auto before = doc.clone();
    (void)apply_operation(doc, AddOp{parse_path("key_terms"), "y"});
    EXPECT_EQ(doc, before);
}

// =============================================================================
// Delete
// =============================================================================

TEST(Delete, removes_key) {
    const auto result = apply_operation(pack_document(), DeleteOp{parse_path("business_context")});
    EXPECT_FALSE(result.as_mapping().contains("business_context"));
}

TEST(Delete, removes_index_and_shifts) {
    auto doc = pack_document();
    doc = apply_operation(doc, AddOp{parse_path("key_terms"), "y"});
    const auto result = apply_operation(doc, DeleteOp{parse_path("key_terms[0]")});
    EXPECT_EQ(result.at("key_terms"), Node{Sequence{"y"}});
}

TEST(Delete, missing_key_is_path_not_found) {
    expect_failure(minimal_document(), DeleteOp{parse_path("entities")},
                   ErrorKind::path_not_found);
}

TEST(Delete, root_is_invalid) {
    expect_failure(minimal_document(), DeleteOp{Path{}}, ErrorKind::invalid_operation);
}

// =============================================================================
// Update
// =============================================================================

TEST(Update, root_fields) {
    const auto result = apply_operation(
        minimal_document(), UpdateOp{Path{}, Mapping{{"version", "2.0.0"}, {"owner", "ops"}}});
    EXPECT_EQ(result.at("version"), Node{"2.0.0"});
    EXPECT_EQ(result.at("owner"), Node{"ops"});
    EXPECT_EQ(result.at("name"), Node{"T"});
}

TEST(Update, nested_mapping) {
    const auto result = apply_operation(
        pack_document(), UpdateOp{parse_path("entities[0]"), Mapping{{"type", "LAWYER"}}});
    EXPECT_EQ(result.at("entities").at(std::size_t{0}).at("type"), Node{"LAWYER"});
    EXPECT_EQ(result.at("entities").at(std::size_t{0}).at("name"), Node{"Attorney"});
}

TEST(Update, non_mapping_target_is_not_an_object) {
    expect_failure(pack_document(), UpdateOp{parse_path("key_terms"), Mapping{{"a", 1}}},
                   ErrorKind::not_an_object);
}

TEST(Update, missing_target_is_path_not_found) {
    expect_failure(pack_document(), UpdateOp{parse_path("nothing"), Mapping{{"a", 1}}},
                   ErrorKind::path_not_found);
}

// =============================================================================
// Merge
// =============================================================================

TEST(Merge, mappings_payload_wins) {
    const auto result = apply_operation(
        pack_document(),
        MergeOp{parse_path("business_context"),
                Mapping{{"litigation", Sequence{"appeal"}}, {"tax", Sequence{"audit"}}}});
    EXPECT_EQ(result.at("business_context").at("litigation"), Node{Sequence{"appeal"}});
    EXPECT_EQ(result.at("business_context").at("tax"), Node{Sequence{"audit"}});
}

TEST(Merge, sequences_are_appended) {
    const auto result = apply_operation(
        pack_document(), MergeOp{parse_path("key_terms"), Sequence{"y", "x"}});
    EXPECT_EQ(result.at("key_terms"), (Node{Sequence{"x", "y", "x"}}));
}

TEST(Merge, into_root) {
    const auto result = apply_operation(
        minimal_document(), MergeOp{Path{}, Mapping{{"key_terms", Sequence{"a"}}}});
    EXPECT_EQ(result.at("key_terms"), Node{Sequence{"a"}});
}

TEST(Merge, mixed_kinds_are_type_mismatch) {
    expect_failure(pack_document(), MergeOp{parse_path("key_terms"), Mapping{{"a", 1}}},
                   ErrorKind::type_mismatch);
    expect_failure(pack_document(), MergeOp{parse_path("name"), "suffix"},
                   ErrorKind::type_mismatch);
}

// =============================================================================
// AddUnique
// =============================================================================

TEST(AddUnique, appends_missing_item) {
    const auto result = apply_operation(pack_document(), AddUniqueOp{parse_path("key_terms"), "y"});
    EXPECT_EQ(result.at("key_terms"), (Node{Sequence{"x", "y"}}));
}

TEST(AddUnique, skips_present_item) {
    const auto result = apply_operation(pack_document(), AddUniqueOp{parse_path("key_terms"), "x"});
    EXPECT_EQ(result.at("key_terms"), Node{Sequence{"x"}});
}

TEST(AddUnique, present_mapping_item_compared_structurally) {
    const auto item = Node{Mapping{{"attributes", Sequence{"name"}}, {"type", "ATTORNEY"},
                                   {"name", "Attorney"}}};
    const auto result = apply_operation(pack_document(), AddUniqueOp{parse_path("entities"), item});
    EXPECT_EQ(result.at("entities").size(), 1u);
}

TEST(AddUnique, existing_key_is_left_alone) {
    const auto result = apply_operation(minimal_document(), AddUniqueOp{parse_path("version"), "9.9.9"});
    EXPECT_EQ(result.at("version"), Node{"1.0.0"});
}

TEST(AddUnique, absent_key_falls_back_to_add) {
    const auto result = apply_operation(minimal_document(), AddUniqueOp{parse_path("key_terms"), "y"});
    EXPECT_EQ(result.at("key_terms"), Node{"y"});
}

TEST(AddUnique, index_past_end_with_present_value_is_noop) {
    const auto result = apply_operation(pack_document(), AddUniqueOp{parse_path("key_terms[1]"), "x"});
    EXPECT_EQ(result.at("key_terms"), Node{Sequence{"x"}});
}

// =============================================================================
// Assert
// =============================================================================

TEST(Assert, equals_holds) {
    const auto doc = minimal_document();
    const auto result = apply_operation(doc, AssertOp{parse_path("version"), Node{"1.0.0"}, {}});
    EXPECT_EQ(result, doc);
}

TEST(Assert, equals_fails_with_expected_and_actual) {
    try {
        (void)apply_operation(minimal_document(), AssertOp{parse_path("version"), Node{"2.0.0"}, {}});
        FAIL();
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::assertion_failed);
        const auto message = std::string{e.what()};
        EXPECT_NE(message.find("\"2.0.0\""), std::string::npos);
        EXPECT_NE(message.find("\"1.0.0\""), std::string::npos);
    }
}

TEST(Assert, exists_checks) {
    const auto doc = minimal_document();
    EXPECT_NO_THROW((void)apply_operation(doc, AssertOp{parse_path("name"), {}, true}));
    EXPECT_NO_THROW((void)apply_operation(doc, AssertOp{parse_path("entities"), {}, false}));
    expect_failure(doc, AssertOp{parse_path("entities"), {}, true}, ErrorKind::assertion_failed);
    expect_failure(doc, AssertOp{parse_path("name"), {}, false}, ErrorKind::assertion_failed);
}

TEST(Assert, explicit_null_expectation_is_checked) {
    const auto doc = Node{Mapping{{"note", Node{}}, {"other", 1}}};
    EXPECT_NO_THROW((void)apply_operation(doc, AssertOp{parse_path("note"), Node{}, {}}));
    expect_failure(doc, AssertOp{parse_path("other"), Node{}, {}}, ErrorKind::assertion_failed);
}

TEST(Assert, nan_matches_nan) {
    const auto nan = std::numeric_limits<double>::quiet_NaN();
    const auto doc = Node{Mapping{{"confidence", nan}}};
    EXPECT_NO_THROW((void)apply_operation(doc, AssertOp{parse_path("confidence"), Node{nan}, {}}));
}

TEST(Assert, root_equality) {
    const auto doc = minimal_document();
    EXPECT_NO_THROW((void)apply_operation(doc, AssertOp{Path{}, doc, {}}));
}

TEST(Assert, without_condition_is_invalid) {
    expect_failure(minimal_document(), AssertOp{parse_path("name"), {}, {}},
                   ErrorKind::invalid_operation);
}

TEST(Assert, never_changes_the_document) {
    const auto doc = pack_document();
    const auto ops = std::vector<Operation>{
        AssertOp{parse_path("key_terms"), Node{Sequence{"x"}}, true},
        AssertOp{parse_path("entities[0].name"), Node{"Attorney"}, {}},
        AssertOp{parse_path("missing"), {}, false},
    };
    const auto result = apply_batch(doc, ops);
    EXPECT_EQ(result, doc);
    EXPECT_TRUE(result.shares_storage_with(doc));
}

// =============================================================================
// Batches
// =============================================================================

TEST(ApplyBatch, threads_operations_in_order) {
    const auto ops = std::vector<Operation>{
        UpdateOp{Path{}, Mapping{{"version", "2.0.0"}}},
        AddOp{parse_path("key_terms"), "legal"},
        AssertOp{parse_path("key_terms"), Node{"legal"}, {}},
    };
    const auto result = apply_batch(minimal_document(), ops);
    EXPECT_EQ(result, (Node{Mapping{
        {"name", "T"}, {"description", "T"}, {"version", "2.0.0"}, {"key_terms", "legal"},
    }}));
}

TEST(ApplyBatch, reports_failing_index) {
    const auto doc = minimal_document();
    const auto ops = std::vector<Operation>{
        UpdateOp{Path{}, Mapping{{"version", "2.0.0"}}},
        DeleteOp{parse_path("nothing")},
        AddOp{parse_path("key_terms"), "legal"},
    };
    try {
        (void)apply_batch(doc, ops);
        FAIL();
    } catch (const BatchError& e) {
        EXPECT_EQ(e.operation_index(), 1u);
        EXPECT_EQ(e.cause().kind, ErrorKind::path_not_found);
        EXPECT_EQ(e.kind(), ErrorKind::path_not_found);
        EXPECT_NE(std::string{e.what()}.find("index 1"), std::string::npos);
    }
    EXPECT_EQ(doc, minimal_document());
}

TEST(ApplyBatch, empty_list_returns_input) {
    const auto doc = minimal_document();
    EXPECT_EQ(apply_batch(doc, std::vector<Operation>{}), doc);
}
