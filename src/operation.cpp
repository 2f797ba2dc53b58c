#include <packops-cpp/operation.hpp>
#include <packops-cpp/json.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace packops_cpp {

namespace {

auto quoted(const Path& path) -> std::string {
    return "'" + to_string(path) + "'";
}

auto parent_of(const Path& path) -> Path {
    return Path(path.begin(), path.end() - 1);
}

/// The container that holds the terminal segment of `path`, writable.
/// With `auto_create`, a missing parent is created as a sequence when the
/// terminal is an index and as a mapping otherwise.
auto locate_parent(Node& document, const Path& path, bool auto_create) -> Node& {
    if (path.size() == 1) return document;

    auto ref = resolve(document, parent_of(path), auto_create);
    if (ref.exists) return *ref.value;

    auto& map = ref.parent->mapping_mut();
    const auto& key = std::get<KeySegment>(ref.key).key;
    const auto terminal_is_index = std::holds_alternative<IndexSegment>(path.back());
    map.set(key, terminal_is_index ? Node{Sequence{}} : Node{Mapping{}});
    return *map.find(key);
}

[[noreturn]] void throw_container_mismatch(const Path& parent_path, NodeKind expected,
                                           const Node& actual) {
    throw Exception{ErrorKind::type_mismatch,
                    "expected " + std::string{to_string_view(expected)} + " at " +
                    (parent_path.empty() ? std::string{"document root"} : quoted(parent_path)) +
                    ", got " + std::string{to_string_view(actual.kind())}};
}

void append_or_reject(Node& existing, Node value, const Path& path) {
    if (existing.is_sequence()) {
        existing.sequence_mut().push_back(std::move(value));
        return;
    }
    throw Exception{ErrorKind::key_already_exists,
                    "cannot add at " + quoted(path) + ": a " +
                    std::string{to_string_view(existing.kind())} +
                    " value already exists there"};
}

// =============================================================================
// Primitives (each mutates its own copy)
// =============================================================================

void add(Node& document, const AddOp& op, const ApplyOptions& options) {
    if (op.path.empty()) {
        throw Exception{ErrorKind::invalid_operation, "add requires a non-empty path"};
    }
    auto& parent = locate_parent(document, op.path, options.auto_create_paths);

    std::visit(overload{
        [&](const KeySegment& seg) {
            if (!parent.is_mapping()) {
                throw_container_mismatch(parent_of(op.path), NodeKind::mapping, parent);
            }
            auto& map = parent.mapping_mut();
            if (auto* existing = map.find(seg.key)) {
                append_or_reject(*existing, op.value, op.path);
            } else {
                map.set(seg.key, op.value);
            }
        },
        [&](const IndexSegment& seg) {
            if (!parent.is_sequence()) {
                throw_container_mismatch(parent_of(op.path), NodeKind::sequence, parent);
            }
            auto& seq = parent.sequence_mut();
            if (seg.index == seq.size()) {
                seq.push_back(op.value);
            } else if (seg.index < seq.size()) {
                append_or_reject(seq[seg.index], op.value, op.path);
            } else {
                throw Exception{ErrorKind::index_out_of_bounds,
                                "index " + std::to_string(seg.index) + " out of bounds (length: " +
                                std::to_string(seq.size()) + ") at " + quoted(op.path)};
            }
        },
    }, op.path.back());
}

void remove(Node& document, const DeleteOp& op) {
    if (op.path.empty()) {
        throw Exception{ErrorKind::invalid_operation, "the document root cannot be deleted"};
    }
    delete_value(document, op.path);
}

void update(Node& document, const UpdateOp& op) {
    auto* target = &document;
    if (!op.path.empty()) {
        target = resolve(document, op.path).value;
    }
    if (!target->is_mapping()) {
        throw Exception{ErrorKind::not_an_object,
                        "cannot update " +
                        (op.path.empty() ? std::string{"document root"} : quoted(op.path)) +
                        ": target is a " + std::string{to_string_view(target->kind())} +
                        ", not a mapping"};
    }
    auto& map = target->mapping_mut();
    for (const auto& [field, value] : op.updates) {
        map.set(field, value);
    }
}

void merge(Node& document, const MergeOp& op) {
    auto* target = &document;
    if (!op.path.empty()) {
        target = resolve(document, op.path).value;
    }

    if (target->is_mapping() && op.value.is_mapping()) {
        auto& map = target->mapping_mut();
        for (const auto& [key, value] : op.value.as_mapping()) {
            map.set(key, value);
        }
        return;
    }
    if (target->is_sequence() && op.value.is_sequence()) {
        switch (op.strategy) {
            case MergeStrategy::append: {
                auto& seq = target->sequence_mut();
                const auto& items = op.value.as_sequence();
                seq.insert(seq.end(), items.begin(), items.end());
                return;
            }
        }
    }
    throw Exception{ErrorKind::type_mismatch,
                    "cannot merge a " + std::string{to_string_view(op.value.kind())} +
                    " into a " + std::string{to_string_view(target->kind())} + " at " +
                    (op.path.empty() ? std::string{"document root"} : quoted(op.path))};
}

auto contains(const Sequence& seq, const Node& value) -> bool {
    return std::find(seq.begin(), seq.end(), value) != seq.end();
}

void add_unique(Node& document, const AddUniqueOp& op, const ApplyOptions& options) {
    if (op.path.empty()) {
        throw Exception{ErrorKind::invalid_operation, "add_unique requires a non-empty path"};
    }
    if (!path_exists(document, op.path)) {
        // Covers both a missing key and an index one past the end.
        if (const auto* seg = std::get_if<IndexSegment>(&op.path.back());
            seg && path_exists(document, parent_of(op.path))) {
            auto& parent = locate_parent(document, op.path, false);
            if (parent.is_sequence() && contains(parent.as_sequence(), op.value)) return;
        }
        add(document, AddOp{op.path, op.value}, options);
        return;
    }

    auto& target = *resolve(document, op.path).value;
    if (target.is_sequence() && !contains(target.as_sequence(), op.value)) {
        target.sequence_mut().push_back(op.value);
    }
    // An existing non-sequence value is left as it is.
}

void check_assertion(const Node& document, const AssertOp& op) {
    const auto where = op.path.empty() ? std::string{"document root"} : quoted(op.path);

    if (op.exists) {
        const auto present = path_exists(document, op.path);
        if (present != *op.exists) {
            throw Exception{ErrorKind::assertion_failed,
                            "assertion failed at " + where + ": expected path to " +
                            (*op.exists ? "exist" : "be absent") + ", but it " +
                            (present ? "exists" : "does not exist")};
        }
    }

    if (op.equals) {
        const auto actual = get_value(document, op.path);
        if (!actual) {
            throw Exception{ErrorKind::assertion_failed,
                            "assertion failed at " + where + ": expected " +
                            dump_json(*op.equals) + ", but the path does not exist"};
        }
        if (!(*actual == *op.equals)) {
            throw Exception{ErrorKind::assertion_failed,
                            "assertion failed at " + where + ": expected " +
                            dump_json(*op.equals) + ", got " + dump_json(*actual)};
        }
    }
}

}  // anonymous namespace

// =============================================================================
// Public API
// =============================================================================

auto parse_op_type(std::string_view name) -> std::optional<OpType> {
    for (auto type : {OpType::add, OpType::del, OpType::update, OpType::merge,
                      OpType::add_unique, OpType::assertion}) {
        if (to_string_view(type) == name) return type;
    }
    return std::nullopt;
}

auto op_type(const Operation& op) -> OpType {
    return std::visit(overload{
        [](const AddOp&) { return OpType::add; },
        [](const DeleteOp&) { return OpType::del; },
        [](const UpdateOp&) { return OpType::update; },
        [](const MergeOp&) { return OpType::merge; },
        [](const AddUniqueOp&) { return OpType::add_unique; },
        [](const AssertOp&) { return OpType::assertion; },
    }, op);
}

auto op_path(const Operation& op) -> const Path& {
    return std::visit([](const auto& o) -> const Path& { return o.path; }, op);
}

void check_operation_shape(const Operation& op) {
    if (const auto* a = std::get_if<AssertOp>(&op); a && !a->equals && !a->exists) {
        throw Exception{ErrorKind::invalid_operation,
                        "assert at '" + to_string(a->path) +
                        "' needs at least one of 'equals' or 'exists'"};
    }
}

auto apply_operation(const Node& document, const Operation& op,
                     const ApplyOptions& options) -> Node {
    check_operation_shape(op);

    // Containers are copy-on-write: the copy detaches only along the
    // mutated path.
    auto result = document;
    std::visit(overload{
        [&](const AddOp& o) { add(result, o, options); },
        [&](const DeleteOp& o) { remove(result, o); },
        [&](const UpdateOp& o) { update(result, o); },
        [&](const MergeOp& o) { merge(result, o); },
        [&](const AddUniqueOp& o) { add_unique(result, o, options); },
        [&](const AssertOp& o) { check_assertion(document, o); },
    }, op);
    return result;
}

auto apply_batch(const Node& document, std::span<const Operation> operations,
                 const ApplyOptions& options) -> Node {
    auto current = document;
    for (std::size_t i = 0; i < operations.size(); ++i) {
        try {
            current = apply_operation(current, operations[i], options);
        } catch (const Exception& e) {
            throw BatchError{i, e.error()};
        }
    }
    return current;
}

}  // namespace packops_cpp
