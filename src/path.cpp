#include <packops-cpp/path.hpp>

#include <charconv>
#include <string>
#include <utility>

namespace packops_cpp {

namespace {

auto is_identifier_start(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

auto is_identifier_char(char c) -> bool {
    return is_identifier_start(c) || (c >= '0' && c <= '9');
}

[[noreturn]] void syntax_error(std::string_view text, std::size_t pos, std::string_view what) {
    throw Exception{ErrorKind::invalid_path_syntax,
                    "invalid path '" + std::string{text} + "': " + std::string{what} +
                    " at position " + std::to_string(pos)};
}

auto segment_label(const Path& path, std::size_t i) -> std::string {
    auto prefix = Path(path.begin(), path.begin() + static_cast<std::ptrdiff_t>(i + 1));
    return "'" + to_string(prefix) + "' (segment " + std::to_string(i) + ")";
}

}  // anonymous namespace

// =============================================================================
// Parsing and rendering
// =============================================================================

auto parse_path(std::string_view text) -> Path {
    if (text.empty()) {
        throw Exception{ErrorKind::invalid_path_syntax, "path cannot be empty"};
    }

    auto segments = Path{};
    auto pos = std::size_t{0};

    while (pos < text.size()) {
        const auto c = text[pos];

        if (c == '[') {
            const auto close = text.find(']', pos + 1);
            if (close == std::string_view::npos) {
                syntax_error(text, pos, "unterminated '['");
            }
            const auto digits = text.substr(pos + 1, close - pos - 1);
            if (digits.empty()) {
                syntax_error(text, pos, "empty index");
            }
            auto index = std::size_t{0};
            auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), index);
            if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
                syntax_error(text, pos, "non-numeric index '" + std::string{digits} + "'");
            }
            segments.push_back(IndexSegment{index});
            pos = close + 1;
            continue;
        }

        // A key: either the first token, or introduced by a dot.
        if (c == '.') {
            if (segments.empty()) {
                syntax_error(text, pos, "leading '.'");
            }
            ++pos;
            if (pos >= text.size()) {
                syntax_error(text, pos, "trailing '.'");
            }
        } else if (!segments.empty()) {
            syntax_error(text, pos, "expected '.' or '['");
        }

        if (!is_identifier_start(text[pos])) {
            syntax_error(text, pos, text[pos] == '.' ? "consecutive '.'" : "expected identifier");
        }
        const auto start = pos;
        while (pos < text.size() && is_identifier_char(text[pos])) {
            ++pos;
        }
        segments.push_back(KeySegment{std::string{text.substr(start, pos - start)}});
    }

    return segments;
}

auto to_string(const PathSegment& segment) -> std::string {
    return std::visit(overload{
        [](const KeySegment& k) { return k.key; },
        [](const IndexSegment& i) { return "[" + std::to_string(i.index) + "]"; },
    }, segment);
}

auto to_string(const Path& path) -> std::string {
    auto result = std::string{};
    for (const auto& segment : path) {
        if (const auto* k = std::get_if<KeySegment>(&segment)) {
            if (!result.empty()) result += '.';
            result += k->key;
        } else {
            result += to_string(segment);
        }
    }
    return result;
}

auto starts_with(const Path& path, const Path& prefix) -> bool {
    if (prefix.size() > path.size()) return false;
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        if (!(path[i] == prefix[i])) return false;
    }
    return true;
}

// =============================================================================
// Resolution
// =============================================================================

auto resolve(Node& document, const Path& path, bool auto_create) -> NodeReference {
    if (path.empty()) {
        throw Exception{ErrorKind::invalid_operation,
                        "empty path: the document root cannot be replaced or deleted"};
    }

    Node* current = &document;
    Node* parent = nullptr;

    for (std::size_t i = 0; i < path.size(); ++i) {
        const auto last = (i + 1 == path.size());
        parent = current;

        if (const auto* seg = std::get_if<KeySegment>(&path[i])) {
            if (!current->is_mapping()) {
                throw Exception{ErrorKind::type_mismatch,
                                "expected mapping at " + segment_label(path, i) + ", got " +
                                std::string{to_string_view(current->kind())}};
            }
            auto& map = current->mapping_mut();
            auto* child = map.find(seg->key);
            if (!child) {
                if (auto_create && last) {
                    return NodeReference{parent, path.back(), nullptr, path, false};
                }
                if (!auto_create) {
                    throw Exception{ErrorKind::path_not_found,
                                    "key '" + seg->key + "' not found at " + segment_label(path, i)};
                }
                const auto next_is_index = std::holds_alternative<IndexSegment>(path[i + 1]);
                map.set(seg->key, next_is_index ? Node{Sequence{}} : Node{Mapping{}});
                child = map.find(seg->key);
            }
            current = child;
        } else {
            const auto index = std::get<IndexSegment>(path[i]).index;
            if (!current->is_sequence()) {
                throw Exception{ErrorKind::type_mismatch,
                                "expected sequence at " + segment_label(path, i) + ", got " +
                                std::string{to_string_view(current->kind())}};
            }
            auto& seq = current->sequence_mut();
            if (index >= seq.size()) {
                throw Exception{ErrorKind::index_out_of_bounds,
                                "index " + std::to_string(index) + " out of bounds (length: " +
                                std::to_string(seq.size()) + ") at " + segment_label(path, i)};
            }
            current = &seq[index];
        }
    }

    return NodeReference{parent, path.back(), current, path, true};
}

auto resolve(const Node& document, const Path& path) -> ConstNodeReference {
    if (path.empty()) {
        throw Exception{ErrorKind::invalid_operation,
                        "empty path: the document root cannot be replaced or deleted"};
    }

    const Node* current = &document;
    const Node* parent = nullptr;

    for (std::size_t i = 0; i < path.size(); ++i) {
        parent = current;

        if (const auto* seg = std::get_if<KeySegment>(&path[i])) {
            if (!current->is_mapping()) {
                throw Exception{ErrorKind::type_mismatch,
                                "expected mapping at " + segment_label(path, i) + ", got " +
                                std::string{to_string_view(current->kind())}};
            }
            const auto* child = current->as_mapping().find(seg->key);
            if (!child) {
                throw Exception{ErrorKind::path_not_found,
                                "key '" + seg->key + "' not found at " + segment_label(path, i)};
            }
            current = child;
        } else {
            const auto index = std::get<IndexSegment>(path[i]).index;
            if (!current->is_sequence()) {
                throw Exception{ErrorKind::type_mismatch,
                                "expected sequence at " + segment_label(path, i) + ", got " +
                                std::string{to_string_view(current->kind())}};
            }
            const auto& seq = current->as_sequence();
            if (index >= seq.size()) {
                throw Exception{ErrorKind::index_out_of_bounds,
                                "index " + std::to_string(index) + " out of bounds (length: " +
                                std::to_string(seq.size()) + ") at " + segment_label(path, i)};
            }
            current = &seq[index];
        }
    }

    return ConstNodeReference{parent, path.back(), current, path, true};
}

auto path_exists(const Node& document, const Path& path) -> bool {
    if (path.empty()) return true;
    try {
        return resolve(document, path).exists;
    } catch (const Exception&) {
        return false;
    }
}

auto get_value(const Node& document, const Path& path) -> std::optional<Node> {
    if (path.empty()) return document;
    try {
        auto ref = resolve(document, path);
        if (!ref.exists) return std::nullopt;
        return *ref.value;
    } catch (const Exception&) {
        return std::nullopt;
    }
}

void set_value(Node& document, const Path& path, Node value, bool auto_create) {
    auto ref = resolve(document, path, auto_create);
    if (ref.exists) {
        *ref.value = std::move(value);
        return;
    }
    ref.parent->mapping_mut().set(std::get<KeySegment>(ref.key).key, std::move(value));
}

auto delete_value(Node& document, const Path& path) -> Node {
    auto ref = resolve(document, path);
    auto removed = *ref.value;
    std::visit(overload{
        [&](const KeySegment& k) { ref.parent->mapping_mut().erase(k.key); },
        [&](const IndexSegment& i) {
            auto& seq = ref.parent->sequence_mut();
            seq.erase(seq.begin() + static_cast<std::ptrdiff_t>(i.index));
        },
    }, ref.key);
    return removed;
}

}  // namespace packops_cpp
