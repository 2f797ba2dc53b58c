#include <packops-cpp/node.hpp>

#include <algorithm>
#include <cmath>
#include <string>

namespace packops_cpp {

namespace {

[[noreturn]] void throw_kind_mismatch(NodeKind expected, NodeKind actual) {
    throw Exception{ErrorKind::type_mismatch,
                    "expected " + std::string{to_string_view(expected)} +
                    ", got " + std::string{to_string_view(actual)}};
}

}  // anonymous namespace

// =============================================================================
// Mapping
// =============================================================================

Mapping::Mapping(std::initializer_list<value_type> entries) {
    entries_.reserve(entries.size());
    for (const auto& [k, v] : entries) {
        set(k, v);
    }
}

auto Mapping::at(std::string_view key) -> Node& {
    if (auto* v = find(key)) return *v;
    throw Exception{ErrorKind::path_not_found,
                    "key '" + std::string{key} + "' not found"};
}

auto Mapping::at(std::string_view key) const -> const Node& {
    if (const auto* v = find(key)) return *v;
    throw Exception{ErrorKind::path_not_found,
                    "key '" + std::string{key} + "' not found"};
}

auto Mapping::set(std::string key, Node value) -> bool {
    if (auto* existing = find(key)) {
        *existing = std::move(value);
        return false;
    }
    entries_.emplace_back(std::move(key), std::move(value));
    return true;
}

auto Mapping::erase(std::string_view key) -> bool {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const value_type& e) { return e.first == key; });
    if (it == entries_.end()) return false;
    entries_.erase(it);
    return true;
}

auto Mapping::keys() const -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    result.reserve(entries_.size());
    for (const auto& [k, v] : entries_) {
        result.push_back(k);
    }
    return result;
}

auto operator==(const Mapping& lhs, const Mapping& rhs) -> bool {
    if (lhs.size() != rhs.size()) return false;
    for (const auto& [k, v] : lhs.entries_) {
        const auto* other = rhs.find(k);
        if (!other || !(*other == v)) return false;
    }
    return true;
}

// =============================================================================
// Node
// =============================================================================

auto Node::as_bool() const -> bool {
    if (const auto* b = std::get_if<bool>(&data_)) return *b;
    throw_kind_mismatch(NodeKind::boolean, kind());
}

auto Node::as_integer() const -> std::int64_t {
    if (const auto* i = std::get_if<std::int64_t>(&data_)) return *i;
    throw_kind_mismatch(NodeKind::integer, kind());
}

auto Node::as_real() const -> double {
    if (const auto* d = std::get_if<double>(&data_)) return *d;
    throw_kind_mismatch(NodeKind::real, kind());
}

auto Node::as_number() const -> double {
    if (const auto* i = std::get_if<std::int64_t>(&data_)) return static_cast<double>(*i);
    if (const auto* d = std::get_if<double>(&data_)) return *d;
    throw_kind_mismatch(NodeKind::real, kind());
}

auto Node::as_string() const -> const std::string& {
    if (const auto* s = std::get_if<std::string>(&data_)) return *s;
    throw_kind_mismatch(NodeKind::string, kind());
}

auto Node::as_sequence() const -> const Sequence& {
    if (const auto* p = std::get_if<std::shared_ptr<Sequence>>(&data_)) return **p;
    throw_kind_mismatch(NodeKind::sequence, kind());
}

auto Node::as_mapping() const -> const Mapping& {
    if (const auto* p = std::get_if<std::shared_ptr<Mapping>>(&data_)) return **p;
    throw_kind_mismatch(NodeKind::mapping, kind());
}

auto Node::sequence_mut() -> Sequence& {
    auto* p = std::get_if<std::shared_ptr<Sequence>>(&data_);
    if (!p) throw_kind_mismatch(NodeKind::sequence, kind());
    if (p->use_count() > 1) {
        *p = std::make_shared<Sequence>(**p);
    }
    return **p;
}

auto Node::mapping_mut() -> Mapping& {
    auto* p = std::get_if<std::shared_ptr<Mapping>>(&data_);
    if (!p) throw_kind_mismatch(NodeKind::mapping, kind());
    if (p->use_count() > 1) {
        *p = std::make_shared<Mapping>(**p);
    }
    return **p;
}

auto Node::size() const noexcept -> std::size_t {
    if (const auto* p = std::get_if<std::shared_ptr<Sequence>>(&data_)) return (*p)->size();
    if (const auto* p = std::get_if<std::shared_ptr<Mapping>>(&data_)) return (*p)->size();
    return 0;
}

auto Node::find(std::string_view key) const -> const Node* {
    if (const auto* p = std::get_if<std::shared_ptr<Mapping>>(&data_)) {
        return (*p)->find(key);
    }
    return nullptr;
}

auto Node::at(std::string_view key) const -> const Node& {
    return as_mapping().at(key);
}

auto Node::at(std::size_t index) const -> const Node& {
    const auto& seq = as_sequence();
    if (index >= seq.size()) {
        throw Exception{ErrorKind::index_out_of_bounds,
                        "index " + std::to_string(index) + " out of bounds (length: " +
                        std::to_string(seq.size()) + ")"};
    }
    return seq[index];
}

auto Node::clone() const -> Node {
    return std::visit(overload{
        [](const std::shared_ptr<Sequence>& seq) -> Node {
            auto copy = Sequence{};
            copy.reserve(seq->size());
            for (const auto& item : *seq) {
                copy.push_back(item.clone());
            }
            return Node{std::move(copy)};
        },
        [](const std::shared_ptr<Mapping>& map) -> Node {
            auto copy = Mapping{};
            for (const auto& [k, v] : *map) {
                copy.set(k, v.clone());
            }
            return Node{std::move(copy)};
        },
        [this](const auto&) -> Node { return *this; },
    }, data_);
}

auto Node::shares_storage_with(const Node& other) const noexcept -> bool {
    if (const auto* a = std::get_if<std::shared_ptr<Sequence>>(&data_)) {
        const auto* b = std::get_if<std::shared_ptr<Sequence>>(&other.data_);
        return b && a->get() == b->get();
    }
    if (const auto* a = std::get_if<std::shared_ptr<Mapping>>(&data_)) {
        const auto* b = std::get_if<std::shared_ptr<Mapping>>(&other.data_);
        return b && a->get() == b->get();
    }
    return false;
}

auto operator==(const Node& lhs, const Node& rhs) -> bool {
    // Integers and reals compare by numeric value, as in JSON. NaN equals
    // NaN so that a document always equals itself.
    if (lhs.is_number() && rhs.is_number()) {
        if (lhs.is_integer() && rhs.is_integer()) return lhs.as_integer() == rhs.as_integer();
        const auto a = lhs.as_number();
        const auto b = rhs.as_number();
        if (std::isnan(a) || std::isnan(b)) return std::isnan(a) && std::isnan(b);
        return a == b;
    }
    if (lhs.kind() != rhs.kind()) return false;
    if (lhs.shares_storage_with(rhs)) return true;

    return std::visit(overload{
        [&](Null) { return true; },
        [&](bool b) { return b == rhs.as_bool(); },
        [&](std::int64_t) { return false; },
        [&](double) { return false; },
        [&](const std::string& s) { return s == rhs.as_string(); },
        [&](const std::shared_ptr<Sequence>& seq) { return *seq == rhs.as_sequence(); },
        [&](const std::shared_ptr<Mapping>& map) { return *map == rhs.as_mapping(); },
    }, lhs.data_);
}

auto schema_type_name(const Node& node) -> std::string_view {
    switch (node.kind()) {
        case NodeKind::null:     return "null";
        case NodeKind::boolean:  return "boolean";
        case NodeKind::integer:  return "integer";
        case NodeKind::real:     return "number";
        case NodeKind::string:   return "string";
        case NodeKind::sequence: return "array";
        case NodeKind::mapping:  return "object";
    }
    return "unknown";
}

}  // namespace packops_cpp
