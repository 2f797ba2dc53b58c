/// @file safety.hpp
/// @brief Static pre-mutation checks over a proposed operation list.

#pragma once

#include <packops-cpp/node.hpp>
#include <packops-cpp/operation.hpp>
#include <packops-cpp/schema.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace packops_cpp {

/// Whether a finding blocks execution.
enum class Severity : std::uint8_t {
    warning,  ///< Reported; blocks only in strict mode.
    error,    ///< Always blocks.
};

/// Convert a Severity to its string representation.
constexpr auto to_string_view(Severity severity) noexcept -> std::string_view {
    switch (severity) {
        case Severity::warning: return "warning";
        case Severity::error:   return "error";
    }
    return "unknown";
}

/// One finding of the safety pass.
struct SafetyIssue {
    Severity severity{Severity::warning};
    std::string code;                 ///< e.g. "REQUIRED_FIELD_DELETION".
    std::string message;
    std::optional<std::string> path{};  ///< Rendered path, when the finding has one.
    Mapping context{};                ///< Structured details (counts, keys, values).
};

/// All findings of one safety pass.
struct SafetyCheckResult {
    std::vector<SafetyIssue> errors;
    std::vector<SafetyIssue> warnings;

    auto passed() const noexcept -> bool { return errors.empty(); }
    auto has_blocking_errors() const noexcept -> bool { return !errors.empty(); }
};

/// The paths protected by default when no list is configured.
auto default_forbidden_paths() -> std::vector<std::string>;

struct SafetyOptions {
    /// Batches larger than this produce a single BULK_CHANGE_WARNING.
    std::size_t bulk_threshold{10};
    /// Protected path prefixes. nullopt or an empty list means
    /// default_forbidden_paths().
    std::optional<std::vector<std::string>> forbidden_paths{};
};

// -- Individual rules ---------------------------------------------------------

/// A delete whose first segment is a schema-required top-level field.
auto check_required_field_deletion(const Operation& op, const Schema& schema)
    -> std::optional<SafetyIssue>;

/// Payload values whose kind disagrees with the schema-declared type.
auto check_type_compatibility(const Operation& op, const Node& document, const Schema& schema)
    -> std::vector<SafetyIssue>;

auto check_bulk_change_threshold(std::size_t operation_count, std::size_t threshold)
    -> std::optional<SafetyIssue>;

/// An add whose terminal mapping key already exists.
auto check_key_overwrite(const Operation& op, const Node& document)
    -> std::optional<SafetyIssue>;

/// A payload that shares storage with the document root.
auto check_circular_reference(const Operation& op, const Node& document)
    -> std::optional<SafetyIssue>;

/// Index segments over non-sequences, and out-of-range indices for
/// delete, update and merge.
auto check_array_index_bounds(const Operation& op, const Node& document)
    -> std::optional<SafetyIssue>;

/// Touched paths equal to or nested under a forbidden prefix.
auto check_forbidden_paths(const Operation& op, const std::vector<std::string>& forbidden)
    -> std::vector<SafetyIssue>;

/// True if the rendered `path` equals `prefix` or lies underneath it
/// (`name` protects `name` and `name.x`, not `names`).
auto matches_path_prefix(std::string_view path, std::string_view prefix) -> bool;

// -- The pass -----------------------------------------------------------------

/// Run every rule over every operation and collect all findings.
auto run_safety_checks(std::span<const Operation> operations, const Node& document,
                       const Schema& schema, const SafetyOptions& options = {})
    -> SafetyCheckResult;

}  // namespace packops_cpp
