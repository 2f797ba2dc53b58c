/// @file json.hpp
/// @brief nlohmann/json interoperability for packops-cpp.
///
/// Provides ADL serialization (to_json/from_json) for documents, the
/// operation wire format, execution options and every result type, plus
/// JSON text parsing and printing for documents.

#pragma once

#include <packops-cpp/diff.hpp>
#include <packops-cpp/error.hpp>
#include <packops-cpp/executor.hpp>
#include <packops-cpp/node.hpp>
#include <packops-cpp/operation.hpp>
#include <packops-cpp/path.hpp>
#include <packops-cpp/safety.hpp>
#include <packops-cpp/schema.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace packops_cpp {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

// -- Documents ----------------------------------------------------------------

void to_json(nlohmann::json& j, const Node& node);
void from_json(const nlohmann::json& j, Node& node);

/// Key order is preserved through ordered_json.
void to_json(nlohmann::ordered_json& j, const Node& node);
void from_json(const nlohmann::ordered_json& j, Node& node);

// -- Paths and operations (wire shape) ----------------------------------------

/// A path as a list of keys (strings) and indices (integers).
void to_json(nlohmann::json& j, const Path& path);

/// Accepts a list of keys and indices, or a path string in the path grammar.
/// @throws Exception (invalid_input or invalid_path_syntax).
void from_json(const nlohmann::json& j, Path& path);

/// `{"action": ..., "path": [...], "value" | "updates" | "strategy" |
/// "equals" | "exists": ...}`.
void to_json(nlohmann::json& j, const Operation& op);

/// @throws Exception (unknown_action, invalid_operation, invalid_input).
void from_json(const nlohmann::json& j, Operation& op);

/// Decode a list of wire operations.
/// @throws BatchError naming the first operation that does not decode;
///   Exception (invalid_input) if `j` is not a list.
auto operations_from_json(const nlohmann::json& j) -> std::vector<Operation>;

// -- Options ------------------------------------------------------------------

void to_json(nlohmann::json& j, const ExecutionOptions& options);

/// Reads the known keys; unknown keys are ignored.
/// @throws Exception (invalid_input) for a non-object or a mistyped key.
void from_json(const nlohmann::json& j, ExecutionOptions& options);

// -- Results ------------------------------------------------------------------

void to_json(nlohmann::json& j, const Error& error);
void to_json(nlohmann::json& j, const SafetyIssue& issue);
void to_json(nlohmann::json& j, const SafetyCheckResult& result);
void to_json(nlohmann::json& j, const SchemaViolation& violation);
void to_json(nlohmann::json& j, const ValidationError& error);
void to_json(nlohmann::json& j, const ValidationResult& result);
void to_json(nlohmann::json& j, const Diff& diff);
void to_json(nlohmann::json& j, const TransformationError& error);
void to_json(nlohmann::json& j, const ExecutionMetadata& metadata);
void to_json(nlohmann::json& j, const TransformationResult& result);
void to_json(nlohmann::json& j, const PreviewResult& result);

// =============================================================================
// JSON text
// =============================================================================

/// Parse JSON text into a Node (any root kind).
/// @throws Exception (parse_error).
auto parse_json(std::string_view text) -> Node;

/// Pretty-print a document (`indent` spaces, insertion order preserved).
/// @throws Exception (serialization_error), e.g. for invalid UTF-8.
auto serialize_json(const Node& node, int indent = 2) -> std::string;

/// Compact single-line rendering for messages. Never throws; invalid UTF-8
/// is replaced.
auto dump_json(const Node& node) -> std::string;

}  // namespace packops_cpp
