/// @file path.hpp
/// @brief Path segments, the path grammar and path resolution.

#pragma once

#include <packops-cpp/node.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace packops_cpp {

/// A mapping lookup by key.
struct KeySegment {
    std::string key;
    auto operator==(const KeySegment&) const -> bool = default;
};

/// A sequence lookup by zero-based index.
struct IndexSegment {
    std::size_t index{0};
    auto operator==(const IndexSegment&) const -> bool = default;
};

/// A path element: either a mapping key or a sequence index.
using PathSegment = std::variant<KeySegment, IndexSegment>;

/// A path into the document tree (e.g. entities / 0 / name).
using Path = std::vector<PathSegment>;

/// Create a key segment.
inline auto key_segment(std::string key) -> PathSegment {
    return KeySegment{std::move(key)};
}

/// Create an index segment.
inline auto index_segment(std::size_t index) -> PathSegment {
    return IndexSegment{index};
}

/// Parse a path string into segments.
///
/// Grammar: identifiers (`[A-Za-z_][A-Za-z0-9_]*`) joined by `.` are key
/// segments, `[<digits>]` is an index segment.
///
/// @code
/// parse_path("entities[0].name");  // key(entities), index(0), key(name)
/// @endcode
/// @throws Exception (invalid_path_syntax) on empty input, malformed
///   brackets, non-numeric indices, or characters between tokens.
auto parse_path(std::string_view text) -> Path;

/// Render a path in the canonical grammar form (`entities[0].name`).
/// Keys that are not plain identifiers are rendered as-is.
auto to_string(const Path& path) -> std::string;

/// Render a single segment (`name` or `[3]`).
auto to_string(const PathSegment& segment) -> std::string;

/// True if `path` equals `prefix` or lies underneath it.
auto starts_with(const Path& path, const Path& prefix) -> bool;

/// The result of resolving a Path against a document.
///
/// `parent` is the container that holds (or would hold) the terminal
/// location, `value` points at the current value and is null when
/// `exists` is false.
template <typename NodeT>
struct BasicNodeReference {
    NodeT* parent{nullptr};
    PathSegment key;
    NodeT* value{nullptr};
    Path path;
    bool exists{false};
};

/// A reference used as a mutation point.
using NodeReference = BasicNodeReference<Node>;

/// A read-only reference.
using ConstNodeReference = BasicNodeReference<const Node>;

/// Resolve a path for writing.
///
/// Shared container storage along the path is detached, so writes through
/// the returned reference only affect `document`.
/// @param auto_create Create missing intermediate containers (a sequence
///   when the next segment is an index, otherwise a mapping), and return
///   `exists == false` for a missing terminal key instead of failing.
/// @throws Exception with kind invalid_operation (empty path),
///   type_mismatch, index_out_of_bounds or path_not_found.
auto resolve(Node& document, const Path& path, bool auto_create = false) -> NodeReference;

/// Resolve a path for reading. Same rules as the writing overload with
/// `auto_create == false`; nothing is created or detached.
auto resolve(const Node& document, const Path& path) -> ConstNodeReference;

/// Check if a path exists in the document. Never throws for resolution
/// failures.
auto path_exists(const Node& document, const Path& path) -> bool;

/// Get a copy of the value at a path, or nullopt if it does not resolve.
auto get_value(const Node& document, const Path& path) -> std::optional<Node>;

/// Set the value at a path (mutates `document`).
/// A terminal sequence index must already exist.
void set_value(Node& document, const Path& path, Node value, bool auto_create = false);

/// Delete the value at a path (mutates `document`).
/// @return The removed value.
/// @throws Exception (path_not_found) if the path does not exist.
auto delete_value(Node& document, const Path& path) -> Node;

}  // namespace packops_cpp
