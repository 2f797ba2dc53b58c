/// @file operation.hpp
/// @brief Operation types and the pure operation engine.

#pragma once

#include <packops-cpp/error.hpp>
#include <packops-cpp/node.hpp>
#include <packops-cpp/path.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace packops_cpp {

/// The kind of mutation an operation represents.
enum class OpType : std::uint8_t {
    add,         ///< Set an absent key, or append to an existing sequence.
    del,         ///< Delete a key or index.
    update,      ///< Shallow-merge field overrides into a mapping.
    merge,       ///< Merge a mapping into a mapping, or a sequence into a sequence.
    add_unique,  ///< Add only if absent (keys) or not already present (items).
    assertion,   ///< Check a condition; never mutates.
};

/// Convert an OpType to its wire name ("add", "delete", ..., "assert").
constexpr auto to_string_view(OpType type) noexcept -> std::string_view {
    switch (type) {
        case OpType::add:        return "add";
        case OpType::del:        return "delete";
        case OpType::update:     return "update";
        case OpType::merge:      return "merge";
        case OpType::add_unique: return "add_unique";
        case OpType::assertion:  return "assert";
    }
    return "unknown";
}

/// Parse a wire action name. Returns nullopt for unknown actions.
auto parse_op_type(std::string_view name) -> std::optional<OpType>;

/// How a merge combines two sequences.
enum class MergeStrategy : std::uint8_t {
    append,  ///< Concatenate the payload after the existing items.
};

/// Convert a MergeStrategy to its string representation.
constexpr auto to_string_view(MergeStrategy strategy) noexcept -> std::string_view {
    switch (strategy) {
        case MergeStrategy::append: return "append";
    }
    return "unknown";
}

struct AddOp {
    Path path;
    Node value;
};

struct DeleteOp {
    Path path;
};

struct UpdateOp {
    Path path;  ///< Empty path targets the document root.
    Mapping updates;
};

struct MergeOp {
    Path path;  ///< Empty path targets the document root.
    Node value;
    MergeStrategy strategy{MergeStrategy::append};
};

struct AddUniqueOp {
    Path path;
    Node value;
};

/// At least one of `equals` and `exists` must be set.
struct AssertOp {
    Path path;
    std::optional<Node> equals{};
    std::optional<bool> exists{};
};

/// A declarative mutation instruction.
using Operation = std::variant<
    AddOp,
    DeleteOp,
    UpdateOp,
    MergeOp,
    AddUniqueOp,
    AssertOp
>;

/// The OpType of an operation.
auto op_type(const Operation& op) -> OpType;

/// The target path of an operation.
auto op_path(const Operation& op) -> const Path&;

/// Engine settings threaded through every primitive.
struct ApplyOptions {
    /// Create missing intermediate containers for add and add_unique.
    bool auto_create_paths{false};
};

/// Thrown by apply_batch when an operation fails.
class BatchError : public Exception {
public:
    BatchError(std::size_t index, Error cause)
        : Exception{Error{cause.kind,
                          "batch operation failed at index " + std::to_string(index) +
                          ": " + cause.message}},
          index_{index}, cause_{std::move(cause)} {}

    /// Zero-based index of the failing operation.
    auto operation_index() const noexcept -> std::size_t { return index_; }

    /// The error raised by the failing operation itself.
    auto cause() const noexcept -> const Error& { return cause_; }

private:
    std::size_t index_;
    Error cause_;
};

/// Apply one operation to a copy of `document`.
///
/// The input is never modified; container storage that the operation does
/// not touch stays shared between input and result.
/// @throws Exception describing the failure.
auto apply_operation(const Node& document, const Operation& op,
                     const ApplyOptions& options = {}) -> Node;

/// Apply operations in order, each to the result of the previous one.
/// @throws BatchError naming the zero-based index of the failing operation.
auto apply_batch(const Node& document, std::span<const Operation> operations,
                 const ApplyOptions& options = {}) -> Node;

/// Check the payload requirements of an operation that the type system
/// cannot express (an assert needs `equals` or `exists`).
/// @throws Exception (invalid_operation).
void check_operation_shape(const Operation& op);

}  // namespace packops_cpp
