/// @file node.hpp
/// @brief The document model: Node, Sequence, Mapping and tag types.

#pragma once

#include <packops-cpp/error.hpp>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace packops_cpp {

/// Represents a null value.
struct Null {
    auto operator<=>(const Null&) const = default;
    auto operator==(const Null&) const -> bool = default;
};

/// The seven kinds of value a Node can hold.
///
/// The enumerators follow the alternative order of Node::Storage.
enum class NodeKind : std::uint8_t {
    null,
    boolean,
    integer,
    real,
    string,
    sequence,
    mapping,
};

/// Convert a NodeKind to its string representation.
constexpr auto to_string_view(NodeKind kind) noexcept -> std::string_view {
    switch (kind) {
        case NodeKind::null:     return "null";
        case NodeKind::boolean:  return "boolean";
        case NodeKind::integer:  return "integer";
        case NodeKind::real:     return "real";
        case NodeKind::string:   return "string";
        case NodeKind::sequence: return "sequence";
        case NodeKind::mapping:  return "mapping";
    }
    return "unknown";
}

class Node;

/// An ordered sequence of nodes.
using Sequence = std::vector<Node>;

/// A string-keyed map that preserves insertion order.
///
/// Lookups are linear; domain packs have tens of keys per level, not
/// thousands. Equality ignores key order.
class Mapping {
public:
    using value_type = std::pair<std::string, Node>;
    using container_type = std::vector<value_type>;
    using iterator = container_type::iterator;
    using const_iterator = container_type::const_iterator;

    Mapping() = default;

    /// Build from key/value pairs. A repeated key keeps its first position
    /// and its last value.
    Mapping(std::initializer_list<value_type> entries);

    auto size() const noexcept -> std::size_t;
    auto empty() const noexcept -> bool;

    auto begin() noexcept -> iterator;
    auto end() noexcept -> iterator;
    auto begin() const noexcept -> const_iterator;
    auto end() const noexcept -> const_iterator;

    auto contains(std::string_view key) const -> bool;

    /// Pointer to the value at a key, or nullptr.
    auto find(std::string_view key) -> Node*;
    auto find(std::string_view key) const -> const Node*;

    /// The value at a key.
    /// @throws Exception (path_not_found) if the key is absent.
    auto at(std::string_view key) -> Node&;
    auto at(std::string_view key) const -> const Node&;

    /// Insert or replace. A replaced key keeps its position.
    /// @return True if the key was newly inserted.
    auto set(std::string key, Node value) -> bool;

    /// Remove a key.
    /// @return True if the key was present.
    auto erase(std::string_view key) -> bool;

    /// Keys in insertion order.
    auto keys() const -> std::vector<std::string>;

    friend auto operator==(const Mapping& lhs, const Mapping& rhs) -> bool;

private:
    container_type entries_;
};

/// A value in the document tree.
///
/// Scalars are stored inline. Sequences and mappings are stored behind a
/// shared pointer and copied on first mutation, so copying a Node is cheap
/// and never aliases writable state: two Nodes only ever share storage that
/// neither of them is allowed to modify in place.
///
/// @code
/// auto doc = Node{Mapping{
///     {"name", "Legal"},
///     {"key_terms", Sequence{"contract", "clause"}},
/// }};
/// doc.mapping_mut().set("version", "1.0.0");
/// @endcode
class Node {
public:
    using Storage = std::variant<
        Null,
        bool,
        std::int64_t,
        double,
        std::string,
        std::shared_ptr<Sequence>,
        std::shared_ptr<Mapping>
    >;

    Node() = default;
    Node(Null) {}
    Node(bool b) : data_{b} {}
    Node(int i) : data_{static_cast<std::int64_t>(i)} {}
    Node(std::int64_t i) : data_{i} {}
    Node(double d) : data_{d} {}
    Node(const char* s) : data_{std::string{s}} {}
    Node(std::string s) : data_{std::move(s)} {}
    Node(std::string_view s) : data_{std::string{s}} {}
    Node(Sequence seq) : data_{std::make_shared<Sequence>(std::move(seq))} {}
    Node(Mapping map) : data_{std::make_shared<Mapping>(std::move(map))} {}

    // -- Inspection -----------------------------------------------------------

    auto kind() const noexcept -> NodeKind {
        return static_cast<NodeKind>(data_.index());
    }

    auto is_null() const noexcept -> bool { return kind() == NodeKind::null; }
    auto is_bool() const noexcept -> bool { return kind() == NodeKind::boolean; }
    auto is_integer() const noexcept -> bool { return kind() == NodeKind::integer; }
    auto is_real() const noexcept -> bool { return kind() == NodeKind::real; }
    auto is_number() const noexcept -> bool { return is_integer() || is_real(); }
    auto is_string() const noexcept -> bool { return kind() == NodeKind::string; }
    auto is_sequence() const noexcept -> bool { return kind() == NodeKind::sequence; }
    auto is_mapping() const noexcept -> bool { return kind() == NodeKind::mapping; }
    auto is_container() const noexcept -> bool { return is_sequence() || is_mapping(); }

    /// Raw access to the underlying variant, for exhaustive visits.
    auto storage() const noexcept -> const Storage& { return data_; }

    // -- Typed access (throws Exception{type_mismatch} on the wrong kind) -----

    auto as_bool() const -> bool;
    auto as_integer() const -> std::int64_t;
    auto as_real() const -> double;
    /// Integer or real, widened to double.
    auto as_number() const -> double;
    auto as_string() const -> const std::string&;
    auto as_sequence() const -> const Sequence&;
    auto as_mapping() const -> const Mapping&;

    /// Writable sequence access. Detaches shared storage first.
    auto sequence_mut() -> Sequence&;
    /// Writable mapping access. Detaches shared storage first.
    auto mapping_mut() -> Mapping&;

    // -- Navigation helpers ---------------------------------------------------

    /// Number of elements of a container, 0 for scalars.
    auto size() const noexcept -> std::size_t;

    /// Child at a mapping key, or nullptr (also for non-mappings).
    auto find(std::string_view key) const -> const Node*;

    /// Child at a mapping key.
    /// @throws Exception (type_mismatch or path_not_found).
    auto at(std::string_view key) const -> const Node&;

    /// Child at a sequence index.
    /// @throws Exception (type_mismatch or index_out_of_bounds).
    auto at(std::size_t index) const -> const Node&;

    // -- Copying and identity -------------------------------------------------

    /// A deep copy that shares no container storage with this node.
    auto clone() const -> Node;

    /// True if both nodes are containers backed by the same storage.
    auto shares_storage_with(const Node& other) const noexcept -> bool;

    friend auto operator==(const Node& lhs, const Node& rhs) -> bool;

private:
    Storage data_;
};

/// The schema-level type name of a node: "null", "boolean", "integer",
/// "number", "string", "array" or "object".
auto schema_type_name(const Node& node) -> std::string_view;

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const std::string& s) { std::printf("%s\n", s.c_str()); },
///     [](auto&&) { std::printf("other\n"); },
/// }, node.storage());
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

// -- Mapping inline members (need the complete Node) --------------------------

inline auto Mapping::size() const noexcept -> std::size_t { return entries_.size(); }
inline auto Mapping::empty() const noexcept -> bool { return entries_.empty(); }
inline auto Mapping::begin() noexcept -> iterator { return entries_.begin(); }
inline auto Mapping::end() noexcept -> iterator { return entries_.end(); }
inline auto Mapping::begin() const noexcept -> const_iterator { return entries_.begin(); }
inline auto Mapping::end() const noexcept -> const_iterator { return entries_.end(); }

inline auto Mapping::contains(std::string_view key) const -> bool {
    return find(key) != nullptr;
}

inline auto Mapping::find(std::string_view key) -> Node* {
    for (auto& [k, v] : entries_) {
        if (k == key) return &v;
    }
    return nullptr;
}

inline auto Mapping::find(std::string_view key) const -> const Node* {
    for (const auto& [k, v] : entries_) {
        if (k == key) return &v;
    }
    return nullptr;
}

}  // namespace packops_cpp
