#include <packops-cpp/safety.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace packops_cpp {

namespace {

auto string_list(const std::vector<std::string>& items) -> Node {
    auto seq = Sequence{};
    seq.reserve(items.size());
    for (const auto& item : items) seq.emplace_back(item);
    return Node{std::move(seq)};
}

auto count_node(std::size_t n) -> Node {
    return Node{static_cast<std::int64_t>(n)};
}

auto join_types(const std::vector<std::string>& types) -> std::string {
    auto result = std::string{};
    for (const auto& t : types) {
        if (!result.empty()) result += " or ";
        result += t;
    }
    return result;
}

auto is_appending_add(const Operation& op) -> bool {
    return std::holds_alternative<AddOp>(op) || std::holds_alternative<AddUniqueOp>(op);
}

/// Compare `value` with the type declared at `lookup`; report at `target`.
auto type_mismatch_issue(const Schema& schema, const Path& lookup, const Path& target,
                         const Node& value) -> std::optional<SafetyIssue> {
    const auto expected = schema.declared_types(lookup);
    if (expected.empty()) return std::nullopt;
    for (const auto& type : expected) {
        if (matches_schema_type(value, type)) return std::nullopt;
    }

    const auto field = to_string(target);
    const auto actual = std::string{schema_type_name(value)};
    return SafetyIssue{
        .severity = Severity::error,
        .code = "TYPE_MISMATCH",
        .message = "Type mismatch for field '" + field + "': expected " +
                   join_types(expected) + ", got " + actual,
        .path = field,
        .context = Mapping{
            {"expected_type", join_types(expected)},
            {"actual_type", actual},
            {"field", field},
        },
    };
}

/// The payload values an operation would write into the document.
auto payload_values(const Operation& op) -> std::vector<const Node*> {
    return std::visit(overload{
        [](const AddOp& o) { return std::vector<const Node*>{&o.value}; },
        [](const AddUniqueOp& o) { return std::vector<const Node*>{&o.value}; },
        [](const MergeOp& o) { return std::vector<const Node*>{&o.value}; },
        [](const UpdateOp& o) {
            auto values = std::vector<const Node*>{};
            for (const auto& [field, value] : o.updates) values.push_back(&value);
            return values;
        },
        [](const auto&) { return std::vector<const Node*>{}; },
    }, op);
}

auto with_key(Path path, std::string key) -> Path {
    path.push_back(KeySegment{std::move(key)});
    return path;
}

}  // anonymous namespace

auto default_forbidden_paths() -> std::vector<std::string> {
    return {"name"};
}

auto matches_path_prefix(std::string_view path, std::string_view prefix) -> bool {
    if (prefix.empty() || !path.starts_with(prefix)) return false;
    if (path.size() == prefix.size()) return true;
    const auto next = path[prefix.size()];
    return next == '.' || next == '[';
}

// =============================================================================
// Rules
// =============================================================================

auto check_required_field_deletion(const Operation& op, const Schema& schema)
    -> std::optional<SafetyIssue> {
    const auto* del = std::get_if<DeleteOp>(&op);
    if (!del || del->path.empty()) return std::nullopt;

    const auto* first = std::get_if<KeySegment>(&del->path.front());
    if (!first) return std::nullopt;

    const auto required = schema.required_fields();
    if (std::find(required.begin(), required.end(), first->key) == required.end()) {
        return std::nullopt;
    }

    return SafetyIssue{
        .severity = Severity::error,
        .code = "REQUIRED_FIELD_DELETION",
        .message = "Cannot delete required field: " + first->key,
        .path = to_string(del->path),
        .context = Mapping{
            {"field", first->key},
            {"required_fields", string_list(required)},
        },
    };
}

auto check_type_compatibility(const Operation& op, const Node& document, const Schema& schema)
    -> std::vector<SafetyIssue> {
    auto issues = std::vector<SafetyIssue>{};

    if (is_appending_add(op)) {
        const auto& path = op_path(op);
        if (path.empty()) return issues;
        const auto& value = std::holds_alternative<AddOp>(op) ? std::get<AddOp>(op).value
                                                              : std::get<AddUniqueOp>(op).value;
        // Adding to an existing sequence appends, so the value is an item.
        auto lookup = path;
        if (const auto existing = get_value(document, path); existing && existing->is_sequence()) {
            lookup.push_back(IndexSegment{0});
        }
        if (auto issue = type_mismatch_issue(schema, lookup, path, value)) {
            issues.push_back(std::move(*issue));
        }
    } else if (const auto* upd = std::get_if<UpdateOp>(&op)) {
        for (const auto& [field, value] : upd->updates) {
            const auto target = with_key(upd->path, field);
            if (auto issue = type_mismatch_issue(schema, target, target, value)) {
                issues.push_back(std::move(*issue));
            }
        }
    }
    return issues;
}

auto check_bulk_change_threshold(std::size_t operation_count, std::size_t threshold)
    -> std::optional<SafetyIssue> {
    if (operation_count <= threshold) return std::nullopt;
    return SafetyIssue{
        .severity = Severity::warning,
        .code = "BULK_CHANGE_WARNING",
        .message = "Large number of operations (" + std::to_string(operation_count) +
                   ") exceeds threshold (" + std::to_string(threshold) + ")",
        .context = Mapping{
            {"operation_count", count_node(operation_count)},
            {"threshold", count_node(threshold)},
        },
    };
}

auto check_key_overwrite(const Operation& op, const Node& document)
    -> std::optional<SafetyIssue> {
    const auto* add = std::get_if<AddOp>(&op);
    if (!add || add->path.empty()) return std::nullopt;

    const auto* key = std::get_if<KeySegment>(&add->path.back());
    if (!key) return std::nullopt;

    const auto parent = get_value(document, Path(add->path.begin(), add->path.end() - 1));
    if (!parent) return std::nullopt;
    const auto* existing = parent->find(key->key);
    if (!existing) return std::nullopt;

    return SafetyIssue{
        .severity = Severity::warning,
        .code = "KEY_OVERWRITE_WARNING",
        .message = "Add operation targets existing key: " + key->key,
        .path = to_string(add->path),
        .context = Mapping{
            {"key", key->key},
            {"existing_value", *existing},
        },
    };
}

auto check_circular_reference(const Operation& op, const Node& document)
    -> std::optional<SafetyIssue> {
    for (const auto* value : payload_values(op)) {
        if (value->shares_storage_with(document)) {
            return SafetyIssue{
                .severity = Severity::error,
                .code = "CIRCULAR_REFERENCE",
                .message = "Operation would create circular reference to document root",
                .path = to_string(op_path(op)),
                .context = Mapping{
                    {"operation", to_string_view(op_type(op))},
                },
            };
        }
    }
    return std::nullopt;
}

auto check_array_index_bounds(const Operation& op, const Node& document)
    -> std::optional<SafetyIssue> {
    const auto& path = op_path(op);
    const auto type = op_type(op);
    const auto index_must_exist =
        type == OpType::del || type == OpType::update || type == OpType::merge;

    const Node* current = &document;
    for (std::size_t i = 0; i < path.size(); ++i) {
        const auto prefix = Path(path.begin(), path.begin() + static_cast<std::ptrdiff_t>(i + 1));

        if (const auto* seg = std::get_if<IndexSegment>(&path[i])) {
            if (!current->is_sequence()) {
                return SafetyIssue{
                    .severity = Severity::error,
                    .code = "INVALID_ARRAY_ACCESS",
                    .message = "Attempted array access on non-array at path segment " +
                               std::to_string(i),
                    .path = to_string(prefix),
                    .context = Mapping{
                        {"expected", "array"},
                        {"actual", schema_type_name(*current)},
                    },
                };
            }
            const auto length = current->size();
            if (index_must_exist && seg->index >= length) {
                return SafetyIssue{
                    .severity = Severity::error,
                    .code = "ARRAY_INDEX_OUT_OF_BOUNDS",
                    .message = "Array index " + std::to_string(seg->index) +
                               " out of bounds (length: " + std::to_string(length) + ")",
                    .path = to_string(prefix),
                    .context = Mapping{
                        {"index", count_node(seg->index)},
                        {"array_length", count_node(length)},
                    },
                };
            }
            if (seg->index >= length) break;
            current = &current->at(seg->index);
        } else {
            const auto* child = current->find(std::get<KeySegment>(path[i]).key);
            if (!child) break;
            current = child;
        }
    }
    return std::nullopt;
}

auto check_forbidden_paths(const Operation& op, const std::vector<std::string>& forbidden)
    -> std::vector<SafetyIssue> {
    auto issues = std::vector<SafetyIssue>{};
    if (forbidden.empty() || std::holds_alternative<AssertOp>(op)) return issues;

    auto touched = std::vector<std::string>{};
    if (!op_path(op).empty()) touched.push_back(to_string(op_path(op)));
    if (const auto* upd = std::get_if<UpdateOp>(&op)) {
        for (const auto& [field, value] : upd->updates) {
            touched.push_back(to_string(with_key(upd->path, field)));
        }
    }

    for (const auto& path : touched) {
        const auto match = std::find_if(forbidden.begin(), forbidden.end(),
                                        [&](const std::string& p) { return matches_path_prefix(path, p); });
        if (match == forbidden.end()) continue;
        issues.push_back(SafetyIssue{
            .severity = Severity::warning,
            .code = "FORBIDDEN_PATH_MODIFICATION",
            .message = "Modifying protected path: " + path + " (protected prefix '" + *match + "')",
            .path = path,
            .context = Mapping{
                {"matched_prefix", *match},
                {"forbidden_paths", string_list(forbidden)},
            },
        });
    }
    return issues;
}

// =============================================================================
// The pass
// =============================================================================

auto run_safety_checks(std::span<const Operation> operations, const Node& document,
                       const Schema& schema, const SafetyOptions& options)
    -> SafetyCheckResult {
    auto result = SafetyCheckResult{};
    // An absent or empty list falls back to the default prefixes.
    const auto forbidden = options.forbidden_paths && !options.forbidden_paths->empty()
        ? *options.forbidden_paths
        : default_forbidden_paths();

    if (auto issue = check_bulk_change_threshold(operations.size(), options.bulk_threshold)) {
        result.warnings.push_back(std::move(*issue));
    }

    for (const auto& op : operations) {
        if (auto issue = check_required_field_deletion(op, schema)) {
            result.errors.push_back(std::move(*issue));
        }
        for (auto& issue : check_type_compatibility(op, document, schema)) {
            result.errors.push_back(std::move(issue));
        }
        if (auto issue = check_key_overwrite(op, document)) {
            result.warnings.push_back(std::move(*issue));
        }
        if (auto issue = check_circular_reference(op, document)) {
            result.errors.push_back(std::move(*issue));
        }
        if (auto issue = check_array_index_bounds(op, document)) {
            result.errors.push_back(std::move(*issue));
        }
        for (auto& issue : check_forbidden_paths(op, forbidden)) {
            result.warnings.push_back(std::move(issue));
        }
    }

    return result;
}

}  // namespace packops_cpp
