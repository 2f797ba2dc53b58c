/// @file executor.hpp
/// @brief The atomic transformation pipeline.
///
/// execute_transformation() is the all-or-nothing entry point: either every
/// operation is applied and the result validates, or the caller gets the
/// original document back together with phase-tagged errors.

#pragma once

#include <packops-cpp/diff.hpp>
#include <packops-cpp/node.hpp>
#include <packops-cpp/operation.hpp>
#include <packops-cpp/safety.hpp>
#include <packops-cpp/schema.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace packops_cpp {

/// Pipeline phases, in execution order. `parsing` and `serialization` are
/// only reported by the text-level entry points in service.hpp.
enum class Phase : std::uint8_t {
    parsing,
    input_validation,
    operation_count_check,
    deep_copy,
    pre_validation,
    safety_checks,
    apply_operations,
    post_validation,
    diff_computation,
    serialization,
    success,
};

/// Convert a Phase to its string representation.
constexpr auto to_string_view(Phase phase) noexcept -> std::string_view {
    switch (phase) {
        case Phase::parsing:               return "parsing";
        case Phase::input_validation:      return "input_validation";
        case Phase::operation_count_check: return "operation_count_check";
        case Phase::deep_copy:             return "deep_copy";
        case Phase::pre_validation:        return "pre_validation";
        case Phase::safety_checks:         return "safety_checks";
        case Phase::apply_operations:      return "apply_operations";
        case Phase::post_validation:       return "post_validation";
        case Phase::diff_computation:      return "diff_computation";
        case Phase::serialization:         return "serialization";
        case Phase::success:               return "success";
    }
    return "unknown";
}

/// Settings for one transformation.
struct ExecutionOptions {
    bool strict_mode{true};          ///< Any warning blocks execution.
    bool auto_create_paths{false};   ///< Create missing intermediate containers.
    bool preserve_formatting{true};  ///< Accepted for compatibility; no effect.
    std::size_t max_operations{100};
    std::size_t bulk_threshold{10};
    /// Protected path prefixes. nullopt means the default (`name`).
    std::optional<std::vector<std::string>> forbidden_paths{};
    /// Accepted for compatibility. Deadlines are the caller's to enforce.
    double timeout_seconds{30.0};
};

/// A phase-tagged error in a transformation result.
struct TransformationError {
    std::string code;
    std::string message;
    Phase phase{Phase::input_validation};
    std::optional<std::string> path{};
    Mapping context{};
};

struct ExecutionMetadata {
    std::size_t operation_count{0};
    double duration_ms{0.0};
    std::optional<Phase> failed_phase{};
    bool validation_passed{false};
};

/// The outcome of execute_transformation().
///
/// On failure `document` is the caller's original document, unchanged.
struct TransformationResult {
    bool success{false};
    Node document;
    std::optional<Diff> diff{};
    std::vector<TransformationError> errors;
    std::vector<SafetyIssue> warnings;
    std::vector<std::string> affected_paths;
    ExecutionMetadata metadata;
};

/// The outcome of a dry run. Never carries the transformed document.
struct PreviewResult {
    bool would_succeed{false};
    std::optional<Diff> diff{};
    std::vector<TransformationError> errors;
    std::vector<SafetyIssue> warnings;
    std::vector<std::string> affected_paths;
    std::size_t operation_count{0};
};

/// Run the full pipeline over `document`.
///
/// Phases: input_validation, operation_count_check, deep_copy,
/// pre_validation, safety_checks, apply_operations, post_validation,
/// diff_computation. A failing phase ends the run; a failing diff only adds
/// a DIFF_CALCULATION_FAILED warning. Never throws for bad input; any other
/// exception becomes an UNEXPECTED_ERROR in the phase it escaped from.
auto execute_transformation(const Node& document,
                            std::span<const Operation> operations,
                            const Schema& schema = Schema::domain_pack(),
                            const ExecutionOptions& options = {}) -> TransformationResult;

/// Run the same pipeline and report whether it would succeed.
auto preview_transformation(const Node& document,
                            std::span<const Operation> operations,
                            const Schema& schema = Schema::domain_pack(),
                            const ExecutionOptions& options = {}) -> PreviewResult;

/// The rendered paths an operation list touches, in first-seen order.
/// Updates contribute one path per updated field.
auto affected_paths(std::span<const Operation> operations) -> std::vector<std::string>;

/// One independent transformation for execute_all().
struct TransformationRequest {
    Node document;
    std::vector<Operation> operations;
    std::optional<Schema> schema{};  ///< nullopt means Schema::domain_pack().
    ExecutionOptions options{};
};

/// Run independent requests in parallel; results are in request order.
/// A request that fails never affects the results of the others.
auto execute_all(std::span<const TransformationRequest> requests)
    -> std::vector<TransformationResult>;

}  // namespace packops_cpp
