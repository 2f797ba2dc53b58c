/// @file schema.hpp
/// @brief Structural schema validation and the built-in domain pack schema.

#pragma once

#include <packops-cpp/error.hpp>
#include <packops-cpp/node.hpp>
#include <packops-cpp/path.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace nlohmann::json_schema {
class json_validator;
}  // namespace nlohmann::json_schema

namespace packops_cpp {

/// One place where a document does not satisfy a schema.
struct SchemaViolation {
    Path path;            ///< Location of the offending value (empty for the root).
    std::string message; ///< What is wrong with it.

    /// "Validation failed at <path>: <message>", with "root" for the empty path.
    auto describe() const -> std::string;

    auto operator==(const SchemaViolation&) const -> bool = default;
};

/// A document schema in JSON Schema (draft-07), checked by
/// nlohmann::json_schema::json_validator.
///
/// Strings longer than 4096 bytes are not matched against `pattern`; they
/// are reported as violations instead.
///
/// @code
/// const auto& schema = Schema::domain_pack();
/// if (!schema.is_valid(doc)) {
///     for (const auto& v : schema.collect_violations(doc)) {
///         std::printf("%s\n", v.describe().c_str());
///     }
/// }
/// @endcode
class Schema {
public:
    /// Wrap a schema definition. The definition is compiled once, here.
    /// @throws Exception (invalid_schema) if the definition is malformed.
    explicit Schema(Node definition);

    /// The built-in closed domain pack schema.
    static auto domain_pack() -> const Schema&;

    auto definition() const noexcept -> const Node& { return definition_; }

    /// Top-level required field names, in declaration order.
    auto required_fields() const -> std::vector<std::string>;

    /// The type names declared for the location `path` (empty when the
    /// schema says nothing about it). Index segments step into `items`.
    auto declared_types(const Path& path) const -> std::vector<std::string>;

    /// Validate a document.
    /// @throws Exception (schema_violation) carrying the first violation.
    void validate(const Node& document) const;

    /// Every violation, in the order the validator reports them.
    auto collect_violations(const Node& document) const -> std::vector<SchemaViolation>;

    /// Non-throwing form of validate().
    auto is_valid(const Node& document) const -> bool;

private:
    Node definition_;
    std::shared_ptr<const nlohmann::json_schema::json_validator> validator_;
};

/// True if `node` is an instance of the JSON Schema type `type_name`.
/// Reals with an integral value count as "integer".
auto matches_schema_type(const Node& node, std::string_view type_name) -> bool;

/// A validation failure reported by the pre/post mutation helpers and by
/// service::validate().
struct ValidationError {
    std::string code;     ///< e.g. PRE_VALIDATION_FAILED, VALIDATION_ERROR, PARSE_ERROR.
    std::string message;
    std::string phase;    ///< e.g. "pre_mutation", "post_mutation", "parsing".
};

struct ValidationResult {
    bool valid{true};
    std::vector<ValidationError> errors;
};

/// Validate a document before it is mutated.
auto validate_pre_mutation(const Node& document, const Schema& schema) -> ValidationResult;

/// Validate a document after it was mutated.
auto validate_post_mutation(const Node& document, const Schema& schema) -> ValidationResult;

}  // namespace packops_cpp
