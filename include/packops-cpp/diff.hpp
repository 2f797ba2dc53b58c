/// @file diff.hpp
/// @brief Structural diff between two document snapshots.

#pragma once

#include <packops-cpp/node.hpp>
#include <packops-cpp/path.hpp>

#include <cstddef>
#include <string_view>
#include <vector>

namespace packops_cpp {

/// A key or item present on only one side.
struct DiffEntry {
    Path path;
    Node value;
};

/// A scalar whose value changed but whose kind did not.
struct ValueChange {
    Path path;
    Node old_value;
    Node new_value;
};

/// A location whose value changed kind (e.g. string to sequence).
struct TypeChange {
    Path path;
    Node old_value;
    Node new_value;
};

/// The structural delta between two documents.
///
/// Mappings are compared key by key. Sequences are aligned on their longest
/// common subsequence; unaligned items between two aligned ones are paired
/// up in order and compared, and whatever is left over is reported as
/// removed (at its old index) or added (at its new index). An item that
/// moved is therefore a removal plus an addition.
struct Diff {
    std::vector<DiffEntry> added;
    std::vector<DiffEntry> removed;
    std::vector<ValueChange> changed;
    std::vector<TypeChange> type_changes;

    auto total_changes() const noexcept -> std::size_t {
        return added.size() + removed.size() + changed.size() + type_changes.size();
    }

    auto has_changes() const noexcept -> bool { return total_changes() > 0; }

    /// The value change recorded at a rendered path (`version`,
    /// `entities[0].name`), or nullptr.
    auto find_changed(std::string_view path) const -> const ValueChange*;
};

/// Compute the diff from `before` to `after`.
auto compute_diff(const Node& before, const Node& after) -> Diff;

}  // namespace packops_cpp
