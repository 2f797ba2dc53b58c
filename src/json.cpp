#include <packops-cpp/json.hpp>

#include <cstdint>
#include <limits>
#include <string>
#include <utility>

namespace packops_cpp {

namespace {

// =============================================================================
// Node <-> JSON, shared by json and ordered_json
// =============================================================================

template <typename Json>
void node_to_json(Json& j, const Node& node) {
    std::visit(overload{
        [&](Null) { j = nullptr; },
        [&](bool b) { j = b; },
        [&](std::int64_t i) { j = i; },
        [&](double d) { j = d; },
        [&](const std::string& s) { j = s; },
        [&](const std::shared_ptr<Sequence>& seq) {
            j = Json::array();
            for (const auto& item : *seq) {
                auto child = Json{};
                node_to_json(child, item);
                j.push_back(std::move(child));
            }
        },
        [&](const std::shared_ptr<Mapping>& map) {
            j = Json::object();
            for (const auto& [key, value] : *map) {
                node_to_json(j[key], value);
            }
        },
    }, node.storage());
}

template <typename Json>
auto node_from_json(const Json& j) -> Node {
    switch (j.type()) {
        case nlohmann::json::value_t::null:
            return Node{};
        case nlohmann::json::value_t::boolean:
            return Node{j.template get<bool>()};
        case nlohmann::json::value_t::number_integer:
            return Node{j.template get<std::int64_t>()};
        case nlohmann::json::value_t::number_unsigned: {
            const auto u = j.template get<std::uint64_t>();
            if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return Node{static_cast<std::int64_t>(u)};
            }
            return Node{static_cast<double>(u)};
        }
        case nlohmann::json::value_t::number_float:
            return Node{j.template get<double>()};
        case nlohmann::json::value_t::string:
            return Node{j.template get<std::string>()};
        case nlohmann::json::value_t::array: {
            auto seq = Sequence{};
            seq.reserve(j.size());
            for (const auto& item : j) {
                seq.push_back(node_from_json(item));
            }
            return Node{std::move(seq)};
        }
        case nlohmann::json::value_t::object: {
            auto map = Mapping{};
            for (auto it = j.begin(); it != j.end(); ++it) {
                map.set(it.key(), node_from_json(it.value()));
            }
            return Node{std::move(map)};
        }
        case nlohmann::json::value_t::binary:
        case nlohmann::json::value_t::discarded:
            break;
    }
    throw Exception{ErrorKind::invalid_input,
                    std::string{"unsupported JSON value of type "} + j.type_name()};
}

// =============================================================================
// Wire helpers
// =============================================================================

[[noreturn]] void bad_field(std::string_view field, std::string_view expected,
                            const nlohmann::json& got) {
    throw Exception{ErrorKind::invalid_input,
                    "'" + std::string{field} + "' must be " + std::string{expected} +
                    ", got " + got.type_name()};
}

auto read_bool(const nlohmann::json& j, std::string_view field) -> bool {
    if (!j.is_boolean()) bad_field(field, "a boolean", j);
    return j.get<bool>();
}

auto read_count(const nlohmann::json& j, std::string_view field) -> std::size_t {
    if (j.is_number_unsigned()) return j.get<std::size_t>();
    if (j.is_number_integer() && j.get<std::int64_t>() >= 0) {
        return static_cast<std::size_t>(j.get<std::int64_t>());
    }
    bad_field(field, "a non-negative integer", j);
}

auto require_value(const nlohmann::json& j, OpType type) -> Node {
    if (!j.contains("value")) {
        throw Exception{ErrorKind::invalid_operation,
                        "'" + std::string{to_string_view(type)} + "' operation requires 'value'"};
    }
    return j.at("value").get<Node>();
}

auto path_key(const Path& path) -> std::string {
    return path.empty() ? std::string{"root"} : to_string(path);
}

auto optional_string(const std::optional<std::string>& s) -> nlohmann::json {
    return s ? nlohmann::json(*s) : nlohmann::json(nullptr);
}

auto mapping_json(const Mapping& map) -> nlohmann::json {
    auto j = nlohmann::json{};
    to_json(j, Node{map});
    return j;
}

}  // anonymous namespace

// =============================================================================
// Documents
// =============================================================================

void to_json(nlohmann::json& j, const Node& node) { node_to_json(j, node); }
void from_json(const nlohmann::json& j, Node& node) { node = node_from_json(j); }

void to_json(nlohmann::ordered_json& j, const Node& node) { node_to_json(j, node); }
void from_json(const nlohmann::ordered_json& j, Node& node) { node = node_from_json(j); }

// =============================================================================
// Paths and operations
// =============================================================================

void to_json(nlohmann::json& j, const Path& path) {
    j = nlohmann::json::array();
    for (const auto& segment : path) {
        std::visit(overload{
            [&](const KeySegment& k) { j.push_back(k.key); },
            [&](const IndexSegment& i) { j.push_back(i.index); },
        }, segment);
    }
}

void from_json(const nlohmann::json& j, Path& path) {
    if (j.is_string()) {
        path = parse_path(j.get<std::string>());
        return;
    }
    if (!j.is_array()) bad_field("path", "a list or a path string", j);

    path.clear();
    for (const auto& element : j) {
        if (element.is_string()) {
            path.push_back(KeySegment{element.get<std::string>()});
        } else if (element.is_number_integer()) {
            path.push_back(IndexSegment{read_count(element, "path index")});
        } else {
            bad_field("path element", "a string or a non-negative integer", element);
        }
    }
}

void to_json(nlohmann::json& j, const Operation& op) {
    j = nlohmann::json{{"action", to_string_view(op_type(op))}};
    to_json(j["path"], op_path(op));
    std::visit(overload{
        [&](const AddOp& o) { j["value"] = o.value; },
        [&](const DeleteOp&) {},
        [&](const UpdateOp& o) { j["updates"] = mapping_json(o.updates); },
        [&](const MergeOp& o) {
            j["value"] = o.value;
            j["strategy"] = to_string_view(o.strategy);
        },
        [&](const AddUniqueOp& o) { j["value"] = o.value; },
        [&](const AssertOp& o) {
            if (o.equals) j["equals"] = *o.equals;
            if (o.exists) j["exists"] = *o.exists;
        },
    }, op);
}

void from_json(const nlohmann::json& j, Operation& op) {
    if (!j.is_object()) {
        throw Exception{ErrorKind::invalid_input,
                        std::string{"operation must be an object, got "} + j.type_name()};
    }
    if (!j.contains("action") || !j.at("action").is_string()) {
        throw Exception{ErrorKind::invalid_operation, "operation is missing 'action'"};
    }
    const auto action = j.at("action").get<std::string>();
    const auto type = parse_op_type(action);
    if (!type) {
        throw Exception{ErrorKind::unknown_action, "unknown action '" + action + "'"};
    }
    if (!j.contains("path")) {
        throw Exception{ErrorKind::invalid_operation, "operation is missing 'path'"};
    }
    auto path = j.at("path").get<Path>();

    switch (*type) {
        case OpType::add:
            op = AddOp{std::move(path), require_value(j, *type)};
            break;
        case OpType::del:
            op = DeleteOp{std::move(path)};
            break;
        case OpType::update: {
            if (!j.contains("updates") || !j.at("updates").is_object()) {
                throw Exception{ErrorKind::invalid_operation,
                                "'update' operation requires an 'updates' object"};
            }
            auto updates = j.at("updates").get<Node>();
            op = UpdateOp{std::move(path), updates.as_mapping()};
            break;
        }
        case OpType::merge: {
            auto merge = MergeOp{std::move(path), require_value(j, *type)};
            if (j.contains("strategy")) {
                const auto& s = j.at("strategy");
                if (!s.is_string() || s.get<std::string>() != "append") {
                    throw Exception{ErrorKind::invalid_operation,
                                    "unsupported merge strategy " + s.dump() +
                                    " (supported: \"append\")"};
                }
            }
            op = std::move(merge);
            break;
        }
        case OpType::add_unique:
            op = AddUniqueOp{std::move(path), require_value(j, *type)};
            break;
        case OpType::assertion: {
            auto assertion = AssertOp{std::move(path)};
            if (j.contains("equals")) assertion.equals = j.at("equals").get<Node>();
            if (j.contains("exists")) assertion.exists = read_bool(j.at("exists"), "exists");
            op = std::move(assertion);
            break;
        }
    }
    check_operation_shape(op);
}

auto operations_from_json(const nlohmann::json& j) -> std::vector<Operation> {
    if (!j.is_array()) {
        throw Exception{ErrorKind::invalid_input,
                        std::string{"operations must be a list, got "} + j.type_name()};
    }
    auto operations = std::vector<Operation>{};
    operations.reserve(j.size());
    for (std::size_t i = 0; i < j.size(); ++i) {
        try {
            operations.push_back(j[i].get<Operation>());
        } catch (const Exception& e) {
            throw BatchError{i, e.error()};
        }
    }
    return operations;
}

// =============================================================================
// Options
// =============================================================================

void to_json(nlohmann::json& j, const ExecutionOptions& options) {
    j = nlohmann::json{
        {"strict_mode", options.strict_mode},
        {"auto_create_paths", options.auto_create_paths},
        {"preserve_formatting", options.preserve_formatting},
        {"max_operations", options.max_operations},
        {"bulk_threshold", options.bulk_threshold},
        {"timeout_seconds", options.timeout_seconds},
    };
    j["forbidden_paths"] = options.forbidden_paths
        ? nlohmann::json(*options.forbidden_paths)
        : nlohmann::json(nullptr);
}

void from_json(const nlohmann::json& j, ExecutionOptions& options) {
    if (!j.is_object()) bad_field("options", "an object", j);

    if (j.contains("strict_mode")) options.strict_mode = read_bool(j.at("strict_mode"), "strict_mode");
    if (j.contains("auto_create_paths")) {
        options.auto_create_paths = read_bool(j.at("auto_create_paths"), "auto_create_paths");
    }
    if (j.contains("preserve_formatting")) {
        options.preserve_formatting = read_bool(j.at("preserve_formatting"), "preserve_formatting");
    }
    if (j.contains("max_operations")) {
        options.max_operations = read_count(j.at("max_operations"), "max_operations");
    }
    if (j.contains("bulk_threshold")) {
        options.bulk_threshold = read_count(j.at("bulk_threshold"), "bulk_threshold");
    }
    if (j.contains("timeout_seconds")) {
        const auto& t = j.at("timeout_seconds");
        if (!t.is_number()) bad_field("timeout_seconds", "a number", t);
        options.timeout_seconds = t.get<double>();
    }
    if (j.contains("forbidden_paths")) {
        const auto& f = j.at("forbidden_paths");
        if (f.is_null()) {
            options.forbidden_paths.reset();
        } else {
            if (!f.is_array()) bad_field("forbidden_paths", "a list of strings", f);
            auto paths = std::vector<std::string>{};
            for (const auto& p : f) {
                if (!p.is_string()) bad_field("forbidden_paths", "a list of strings", f);
                paths.push_back(p.get<std::string>());
            }
            options.forbidden_paths = std::move(paths);
        }
    }
}

// =============================================================================
// Results
// =============================================================================

void to_json(nlohmann::json& j, const Error& error) {
    j = nlohmann::json{
        {"kind", to_string_view(error.kind)},
        {"code", error_code(error.kind)},
        {"message", error.message},
    };
}

void to_json(nlohmann::json& j, const SafetyIssue& issue) {
    j = nlohmann::json{
        {"level", to_string_view(issue.severity)},
        {"code", issue.code},
        {"message", issue.message},
        {"path", optional_string(issue.path)},
        {"context", mapping_json(issue.context)},
    };
}

void to_json(nlohmann::json& j, const SafetyCheckResult& result) {
    j = nlohmann::json{
        {"passed", result.passed()},
        {"errors", result.errors},
        {"warnings", result.warnings},
    };
}

void to_json(nlohmann::json& j, const SchemaViolation& violation) {
    j = nlohmann::json{
        {"path", path_key(violation.path)},
        {"message", violation.message},
    };
}

void to_json(nlohmann::json& j, const ValidationError& error) {
    j = nlohmann::json{
        {"code", error.code},
        {"message", error.message},
        {"phase", error.phase},
    };
}

void to_json(nlohmann::json& j, const ValidationResult& result) {
    j = nlohmann::json{
        {"valid", result.valid},
        {"errors", result.errors},
        {"warnings", nlohmann::json::array()},
    };
}

void to_json(nlohmann::json& j, const Diff& diff) {
    auto added = nlohmann::json::object();
    for (const auto& e : diff.added) added[path_key(e.path)] = e.value;

    auto removed = nlohmann::json::object();
    for (const auto& e : diff.removed) removed[path_key(e.path)] = e.value;

    auto changed = nlohmann::json::object();
    for (const auto& c : diff.changed) {
        changed[path_key(c.path)] = nlohmann::json{{"old", c.old_value}, {"new", c.new_value}};
    }

    auto type_changes = nlohmann::json::object();
    for (const auto& t : diff.type_changes) {
        type_changes[path_key(t.path)] = nlohmann::json{
            {"old_type", schema_type_name(t.old_value)},
            {"new_type", schema_type_name(t.new_value)},
            {"old_value", t.old_value},
            {"new_value", t.new_value},
        };
    }

    j = nlohmann::json{
        {"added", std::move(added)},
        {"removed", std::move(removed)},
        {"changed", std::move(changed)},
        {"type_changes", std::move(type_changes)},
        {"summary", {
            {"total_changes", diff.total_changes()},
            {"has_changes", diff.has_changes()},
        }},
    };
}

void to_json(nlohmann::json& j, const TransformationError& error) {
    j = nlohmann::json{
        {"code", error.code},
        {"message", error.message},
        {"phase", to_string_view(error.phase)},
        {"path", optional_string(error.path)},
        {"context", mapping_json(error.context)},
    };
}

void to_json(nlohmann::json& j, const ExecutionMetadata& metadata) {
    j = nlohmann::json{
        {"operation_count", metadata.operation_count},
        {"duration_ms", metadata.duration_ms},
        {"validation_passed", metadata.validation_passed},
    };
    j["failed_phase"] = metadata.failed_phase
        ? nlohmann::json(to_string_view(*metadata.failed_phase))
        : nlohmann::json(nullptr);
}

void to_json(nlohmann::json& j, const TransformationResult& result) {
    j = nlohmann::json{
        {"success", result.success},
        {"document", result.document},
        {"errors", result.errors},
        {"warnings", result.warnings},
        {"affected_paths", result.affected_paths},
        {"execution_metadata", result.metadata},
    };
    j["diff"] = result.diff ? nlohmann::json(*result.diff) : nlohmann::json(nullptr);
}

void to_json(nlohmann::json& j, const PreviewResult& result) {
    j = nlohmann::json{
        {"would_succeed", result.would_succeed},
        {"errors", result.errors},
        {"warnings", result.warnings},
        {"affected_paths", result.affected_paths},
        {"operation_count", result.operation_count},
    };
    j["diff"] = result.diff ? nlohmann::json(*result.diff) : nlohmann::json(nullptr);
}

// =============================================================================
// JSON text
// =============================================================================

auto parse_json(std::string_view text) -> Node {
    try {
        const auto j = nlohmann::ordered_json::parse(text.begin(), text.end());
        return node_from_json(j);
    } catch (const nlohmann::json::parse_error& e) {
        throw Exception{ErrorKind::parse_error, std::string{"Failed to parse JSON: "} + e.what()};
    }
}

auto serialize_json(const Node& node, int indent) -> std::string {
    auto j = nlohmann::ordered_json{};
    node_to_json(j, node);
    try {
        return j.dump(indent, ' ', false, nlohmann::ordered_json::error_handler_t::strict);
    } catch (const nlohmann::json::type_error& e) {
        throw Exception{ErrorKind::serialization_error,
                        std::string{"Failed to serialize to JSON: "} + e.what()};
    }
}

auto dump_json(const Node& node) -> std::string {
    auto j = nlohmann::ordered_json{};
    node_to_json(j, node);
    return j.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

}  // namespace packops_cpp
