#include <packops-cpp/yaml.hpp>

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace packops_cpp {

namespace {

constexpr auto core_tag_prefix = std::string_view{"tag:yaml.org,2002:"};

// =============================================================================
// Scalar resolution (YAML 1.2 core schema)
// =============================================================================

// Each matcher is a single left-to-right scan, so scalar length is unbounded.

auto is_one_of(std::string_view text, std::initializer_list<std::string_view> words) -> bool {
    return std::find(words.begin(), words.end(), text) != words.end();
}

auto is_digit(char c) -> bool { return c >= '0' && c <= '9'; }

auto is_octal_digit(char c) -> bool { return c >= '0' && c <= '7'; }

auto is_hex_digit(char c) -> bool {
    return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

/// Consume a run of characters accepted by `pred`; returns its length.
template <typename Pred>
auto skip_while(std::string_view text, std::size_t& pos, Pred pred) -> std::size_t {
    const auto start = pos;
    while (pos < text.size() && pred(text[pos])) ++pos;
    return pos - start;
}

void skip_sign(std::string_view text, std::size_t& pos) {
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) ++pos;
}

// [-+]?[0-9]+
auto is_decimal(std::string_view text) -> bool {
    auto pos = std::size_t{0};
    skip_sign(text, pos);
    return skip_while(text, pos, is_digit) > 0 && pos == text.size();
}

// 0o[0-7]+ and 0x[0-9a-fA-F]+
template <typename Pred>
auto is_prefixed(std::string_view text, std::string_view prefix, Pred pred) -> bool {
    if (!text.starts_with(prefix)) return false;
    auto pos = prefix.size();
    return skip_while(text, pos, pred) > 0 && pos == text.size();
}

// [-+]?(\.[0-9]+|[0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)?
auto is_real(std::string_view text) -> bool {
    auto pos = std::size_t{0};
    skip_sign(text, pos);
    if (skip_while(text, pos, is_digit) > 0) {
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            skip_while(text, pos, is_digit);
        }
    } else {
        if (pos >= text.size() || text[pos] != '.') return false;
        ++pos;
        if (skip_while(text, pos, is_digit) == 0) return false;
    }
    if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
        ++pos;
        skip_sign(text, pos);
        if (skip_while(text, pos, is_digit) == 0) return false;
    }
    return pos == text.size();
}

// [-+]?\.(inf|Inf|INF)
auto is_infinity(std::string_view text) -> bool {
    if (!text.empty() && (text.front() == '-' || text.front() == '+')) text.remove_prefix(1);
    return is_one_of(text, {".inf", ".Inf", ".INF"});
}

auto strip_plus(std::string_view text) -> std::string_view {
    if (!text.empty() && text.front() == '+') text.remove_prefix(1);
    return text;
}

auto to_real(std::string_view text) -> std::optional<double> {
    text = strip_plus(text);
    auto value = 0.0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

auto to_integer(std::string_view digits, int base) -> std::optional<std::int64_t> {
    auto value = std::int64_t{0};
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value, base);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) return std::nullopt;
    return value;
}

/// Type a plain (unquoted, untagged) scalar.
auto resolve_plain(const std::string& text) -> Node {
    if (is_one_of(text, {"", "~", "null", "Null", "NULL"})) return Node{};
    if (is_one_of(text, {"true", "True", "TRUE"})) return Node{true};
    if (is_one_of(text, {"false", "False", "FALSE"})) return Node{false};

    if (is_decimal(text)) {
        if (auto i = to_integer(strip_plus(text), 10)) return Node{*i};
        // Out of int64 range: keep the magnitude as a real.
        if (auto d = to_real(text)) return Node{*d};
        return Node{text};
    }
    if (is_prefixed(text, "0o", is_octal_digit)) {
        if (auto i = to_integer(std::string_view{text}.substr(2), 8)) return Node{*i};
        return Node{text};
    }
    if (is_prefixed(text, "0x", is_hex_digit)) {
        if (auto i = to_integer(std::string_view{text}.substr(2), 16)) return Node{*i};
        return Node{text};
    }
    if (is_real(text)) {
        if (auto d = to_real(text)) return Node{*d};
        return Node{text};
    }
    if (is_infinity(text)) {
        const auto inf = std::numeric_limits<double>::infinity();
        return Node{text.front() == '-' ? -inf : inf};
    }
    if (is_one_of(text, {".nan", ".NaN", ".NAN"})) {
        return Node{std::numeric_limits<double>::quiet_NaN()};
    }
    return Node{text};
}

auto bad_tagged_scalar(std::string_view type, const std::string& text) -> Exception {
    return Exception{ErrorKind::parse_error,
                     "Failed to parse YAML: invalid !!" + std::string{type} +
                     " value '" + text + "'"};
}

/// Type a scalar carrying an explicit core-schema tag.
auto resolve_tagged(std::string_view type, const std::string& text) -> Node {
    if (type == "str") return Node{text};
    if (type == "null") return Node{};

    auto value = resolve_plain(text);
    if (type == "bool" && value.is_bool()) return value;
    if (type == "int" && value.is_integer()) return value;
    if (type == "float" && value.is_number()) return Node{value.as_number()};
    if (type == "bool" || type == "int" || type == "float") {
        throw bad_tagged_scalar(type, text);
    }
    // Other standard tags (!!binary, !!timestamp, ...) keep their text.
    return Node{text};
}

auto resolve_scalar(const std::string& tag, const std::string& text) -> Node {
    // "!" is the non-specific tag of a quoted scalar.
    if (tag == "!") return Node{text};
    if (std::string_view{tag}.starts_with(core_tag_prefix)) {
        return resolve_tagged(std::string_view{tag}.substr(core_tag_prefix.size()), text);
    }
    return resolve_plain(text);
}

// =============================================================================
// YAML::Node -> Node
// =============================================================================

auto from_yaml(const YAML::Node& y) -> Node {
    switch (y.Type()) {
        case YAML::NodeType::Undefined:
            return Node{};
        case YAML::NodeType::Null:
            if (y.Tag() == std::string{core_tag_prefix} + "str") return Node{std::string{}};
            return Node{};
        case YAML::NodeType::Scalar:
            return resolve_scalar(y.Tag(), y.Scalar());
        case YAML::NodeType::Sequence: {
            auto seq = Sequence{};
            seq.reserve(y.size());
            for (const auto& item : y) {
                seq.push_back(from_yaml(item));
            }
            return Node{std::move(seq)};
        }
        case YAML::NodeType::Map: {
            auto map = Mapping{};
            for (auto it = y.begin(); it != y.end(); ++it) {
                if (!it->first.IsScalar()) {
                    throw Exception{ErrorKind::parse_error,
                                    "Failed to parse YAML: mapping keys must be scalars"};
                }
                map.set(it->first.Scalar(), from_yaml(it->second));
            }
            return Node{std::move(map)};
        }
    }
    throw Exception{ErrorKind::parse_error, "Failed to parse YAML: unknown node type"};
}

// =============================================================================
// Node -> YAML::Emitter
// =============================================================================

auto format_real(double d) -> std::string {
    if (std::isnan(d)) return ".nan";
    if (std::isinf(d)) return d < 0 ? "-.inf" : ".inf";

    auto buffer = std::array<char, 32>{};
    const auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), d);
    if (ec != std::errc{}) {
        throw Exception{ErrorKind::serialization_error,
                        "Failed to serialize to YAML: cannot format number"};
    }
    auto text = std::string{buffer.data(), end};
    // Integral reals must not read back as integers.
    if (text.find_first_of(".eE") == std::string::npos) text += ".0";
    return text;
}

void emit_string(YAML::Emitter& out, const std::string& s) {
    if (s.empty() || !resolve_plain(s).is_string()) {
        out << YAML::DoubleQuoted << s;
    } else {
        out << s;
    }
}

void emit(YAML::Emitter& out, const Node& node) {
    std::visit(overload{
        [&](Null) { out << YAML::Null; },
        [&](bool b) { out << b; },
        [&](std::int64_t i) { out << i; },
        [&](double d) { out << format_real(d); },
        [&](const std::string& s) { emit_string(out, s); },
        [&](const std::shared_ptr<Sequence>& seq) {
            out << YAML::BeginSeq;
            for (const auto& item : *seq) emit(out, item);
            out << YAML::EndSeq;
        },
        [&](const std::shared_ptr<Mapping>& map) {
            out << YAML::BeginMap;
            for (const auto& [key, value] : *map) {
                out << YAML::Key;
                emit_string(out, key);
                out << YAML::Value;
                emit(out, value);
            }
            out << YAML::EndMap;
        },
    }, node.storage());
}

}  // anonymous namespace

auto parse_yaml(std::string_view text) -> Node {
    auto root = YAML::Node{};
    try {
        root = YAML::Load(std::string{text});
    } catch (const YAML::Exception& e) {
        throw Exception{ErrorKind::parse_error, std::string{"Failed to parse YAML: "} + e.what()};
    }
    if (!root.IsDefined() || root.IsNull()) {
        throw Exception{ErrorKind::parse_error, "YAML content is empty"};
    }
    return from_yaml(root);
}

auto serialize_yaml(const Node& node) -> std::string {
    auto out = YAML::Emitter{};
    out.SetIndent(2);
    emit(out, node);
    if (!out.good()) {
        throw Exception{ErrorKind::serialization_error,
                        "Failed to serialize to YAML: " + out.GetLastError()};
    }
    return std::string{out.c_str()} + "\n";
}

}  // namespace packops_cpp
