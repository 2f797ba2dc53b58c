#include <packops-cpp/executor.hpp>

#include "task_executor.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <string>
#include <utility>

namespace packops_cpp {

namespace {

using Clock = std::chrono::steady_clock;

auto count_node(std::size_t n) -> Node {
    return Node{static_cast<std::int64_t>(n)};
}

auto issue_to_error(const SafetyIssue& issue) -> TransformationError {
    return TransformationError{
        .code = issue.code,
        .message = issue.message,
        .phase = Phase::safety_checks,
        .path = issue.path,
        .context = issue.context,
    };
}

/// Accumulates the result of one run; every early exit goes through fail().
class Run {
public:
    Run(const Node& original, std::size_t operation_count)
        : original_{original}, start_{Clock::now()} {
        result_.document = original;
        result_.metadata.operation_count = operation_count;
    }

    auto fail(Phase phase, std::vector<TransformationError> errors) -> TransformationResult {
        result_.success = false;
        result_.document = original_;
        result_.diff.reset();
        result_.errors = std::move(errors);
        result_.affected_paths.clear();
        result_.metadata.failed_phase = phase;
        result_.metadata.validation_passed = false;
        return finish();
    }

    auto fail(TransformationError error) -> TransformationResult {
        const auto phase = error.phase;
        auto errors = std::vector<TransformationError>{};
        errors.push_back(std::move(error));
        return fail(phase, std::move(errors));
    }

    auto succeed(Node document) -> TransformationResult {
        result_.success = true;
        result_.document = std::move(document);
        result_.metadata.validation_passed = true;
        return finish();
    }

    auto result() -> TransformationResult& { return result_; }

    void enter(Phase phase) { phase_ = phase; }
    auto phase() const -> Phase { return phase_; }

private:
    auto finish() -> TransformationResult {
        const auto elapsed = std::chrono::duration<double, std::milli>(Clock::now() - start_);
        result_.metadata.duration_ms = elapsed.count();
        return std::move(result_);
    }

    const Node& original_;
    Clock::time_point start_;
    Phase phase_{Phase::input_validation};
    TransformationResult result_;
};

auto unexpected_error(Phase phase, const char* what) -> TransformationError {
    return TransformationError{
        .code = "UNEXPECTED_ERROR",
        .message = std::string{"Unexpected failure: "} + what,
        .phase = phase,
    };
}

}  // anonymous namespace

auto affected_paths(std::span<const Operation> operations) -> std::vector<std::string> {
    auto paths = std::vector<std::string>{};
    auto add = [&](std::string path) {
        if (std::find(paths.begin(), paths.end(), path) == paths.end()) {
            paths.push_back(std::move(path));
        }
    };
    auto with_key = [](Path path, const std::string& key) {
        path.push_back(KeySegment{key});
        return to_string(path);
    };

    for (const auto& op : operations) {
        std::visit(overload{
            [&](const UpdateOp& o) {
                for (const auto& [field, value] : o.updates) add(with_key(o.path, field));
            },
            [&](const MergeOp& o) {
                if (!o.path.empty()) {
                    add(to_string(o.path));
                } else if (o.value.is_mapping()) {
                    for (const auto& [key, value] : o.value.as_mapping()) add(with_key(o.path, key));
                }
            },
            [&](const AssertOp&) {},
            [&](const auto& o) {
                if (!o.path.empty()) add(to_string(o.path));
            },
        }, op);
    }
    return paths;
}

namespace {

auto run_pipeline(Run& run,
                  const Node& document,
                  std::span<const Operation> operations,
                  const Schema& schema,
                  const ExecutionOptions& options) -> TransformationResult {

    // -- input_validation ------------------------------------------------------
    run.enter(Phase::input_validation);
    if (!document.is_mapping()) {
        return run.fail(TransformationError{
            .code = "INVALID_DOCUMENT_TYPE",
            .message = "Document must be a mapping, got " +
                       std::string{to_string_view(document.kind())},
            .phase = Phase::input_validation,
        });
    }
    for (std::size_t i = 0; i < operations.size(); ++i) {
        try {
            check_operation_shape(operations[i]);
        } catch (const Exception& e) {
            return run.fail(TransformationError{
                .code = "INVALID_OPERATION",
                .message = "Operation " + std::to_string(i) + ": " + e.what(),
                .phase = Phase::input_validation,
                .path = to_string(op_path(operations[i])),
                .context = Mapping{{"operation_index", count_node(i)}},
            });
        }
    }

    // -- operation_count_check -------------------------------------------------
    run.enter(Phase::operation_count_check);
    if (operations.size() > options.max_operations) {
        return run.fail(TransformationError{
            .code = "TOO_MANY_OPERATIONS",
            .message = "Operation count (" + std::to_string(operations.size()) +
                       ") exceeds maximum (" + std::to_string(options.max_operations) + ")",
            .phase = Phase::operation_count_check,
            .context = Mapping{
                {"count", count_node(operations.size())},
                {"max", count_node(options.max_operations)},
            },
        });
    }

    // -- deep_copy -------------------------------------------------------------
    run.enter(Phase::deep_copy);
    auto working = Node{};
    try {
        working = document.clone();
    } catch (const std::exception& e) {
        return run.fail(TransformationError{
            .code = "DOCUMENT_COPY_FAILED",
            .message = std::string{"Failed to copy document: "} + e.what(),
            .phase = Phase::deep_copy,
        });
    }

    // -- pre_validation --------------------------------------------------------
    run.enter(Phase::pre_validation);
    try {
        schema.validate(working);
    } catch (const Exception& e) {
        return run.fail(TransformationError{
            .code = "SCHEMA_VALIDATION_FAILED_PRE",
            .message = std::string{"Document invalid before transformation: "} + e.what(),
            .phase = Phase::pre_validation,
        });
    }

    // -- safety_checks ---------------------------------------------------------
    run.enter(Phase::safety_checks);
    // Checked against the caller's document so that payload identity with
    // its root is visible.
    auto safety = run_safety_checks(operations, document, schema, SafetyOptions{
        .bulk_threshold = options.bulk_threshold,
        .forbidden_paths = options.forbidden_paths,
    });
    run.result().warnings = safety.warnings;

    if (safety.has_blocking_errors()) {
        auto errors = std::vector<TransformationError>{};
        for (const auto& issue : safety.errors) errors.push_back(issue_to_error(issue));
        return run.fail(Phase::safety_checks, std::move(errors));
    }
    if (options.strict_mode && !safety.warnings.empty()) {
        auto codes = Sequence{};
        for (const auto& w : safety.warnings) codes.emplace_back(w.code);
        return run.fail(TransformationError{
            .code = "STRICT_MODE_WARNING",
            .message = "Warnings present in strict mode (" +
                       std::to_string(safety.warnings.size()) + ")",
            .phase = Phase::safety_checks,
            .context = Mapping{{"warnings", Node{std::move(codes)}}},
        });
    }

    // -- apply_operations ------------------------------------------------------
    run.enter(Phase::apply_operations);
    try {
        working = apply_batch(working, operations,
                              ApplyOptions{.auto_create_paths = options.auto_create_paths});
    } catch (const BatchError& e) {
        const auto& op = operations[e.operation_index()];
        return run.fail(TransformationError{
            .code = std::string{error_code(e.cause().kind)},
            .message = e.what(),
            .phase = Phase::apply_operations,
            .path = to_string(op_path(op)),
            .context = Mapping{
                {"operation_index", count_node(e.operation_index())},
                {"action", to_string_view(op_type(op))},
            },
        });
    }

    // -- post_validation -------------------------------------------------------
    run.enter(Phase::post_validation);
    try {
        schema.validate(working);
    } catch (const Exception& e) {
        return run.fail(TransformationError{
            .code = "SCHEMA_VALIDATION_FAILED_POST",
            .message = std::string{"Document invalid after transformation: "} + e.what(),
            .phase = Phase::post_validation,
            .context = Mapping{{"validation_error", e.what()}},
        });
    }

    // -- diff_computation ------------------------------------------------------
    run.enter(Phase::diff_computation);
    try {
        run.result().diff = compute_diff(document, working);
    } catch (const std::exception& e) {
        run.result().warnings.push_back(SafetyIssue{
            .severity = Severity::warning,
            .code = "DIFF_CALCULATION_FAILED",
            .message = std::string{"Failed to calculate diff: "} + e.what(),
        });
    }

    run.result().affected_paths = affected_paths(operations);
    return run.succeed(std::move(working));
}

}  // anonymous namespace

auto execute_transformation(const Node& document,
                            std::span<const Operation> operations,
                            const Schema& schema,
                            const ExecutionOptions& options) -> TransformationResult {
    auto run = Run{document, operations.size()};
    try {
        return run_pipeline(run, document, operations, schema, options);
    } catch (const std::exception& e) {
        return run.fail(unexpected_error(run.phase(), e.what()));
    }
}

auto preview_transformation(const Node& document,
                            std::span<const Operation> operations,
                            const Schema& schema,
                            const ExecutionOptions& options) -> PreviewResult {
    auto result = execute_transformation(document, operations, schema, options);
    return PreviewResult{
        .would_succeed = result.success,
        .diff = std::move(result.diff),
        .errors = std::move(result.errors),
        .warnings = std::move(result.warnings),
        .affected_paths = std::move(result.affected_paths),
        .operation_count = operations.size(),
    };
}

auto execute_all(std::span<const TransformationRequest> requests)
    -> std::vector<TransformationResult> {
    auto results = std::vector<TransformationResult>(requests.size());
    if (requests.empty()) return results;

    auto taskflow = tf::Taskflow{};
    taskflow.for_each_index(std::size_t{0}, requests.size(), std::size_t{1},
        [&](std::size_t i) {
            const auto& request = requests[i];
            try {
                const auto& schema = request.schema ? *request.schema : Schema::domain_pack();
                results[i] = execute_transformation(request.document, request.operations,
                                                    schema, request.options);
            } catch (const std::exception& e) {
                // One failing request never takes down the rest of the batch.
                results[i] = Run{request.document, request.operations.size()}
                    .fail(unexpected_error(Phase::input_validation, e.what()));
            }
        });
    detail::global_executor().run(taskflow).wait();
    return results;
}

}  // namespace packops_cpp
