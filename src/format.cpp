#include <packops-cpp/format.hpp>

#include <packops-cpp/json.hpp>
#include <packops-cpp/yaml.hpp>

#include <algorithm>
#include <cctype>
#include <string>

namespace packops_cpp {

namespace {

auto normalize(std::string_view text) -> std::string {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!text.empty() && is_space(text.front())) text.remove_prefix(1);
    while (!text.empty() && is_space(text.back())) text.remove_suffix(1);

    auto out = std::string{text};
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

auto format_label(Format format) -> std::string_view {
    return format == Format::yaml ? "YAML" : "JSON";
}

}  // anonymous namespace

auto parse_format(std::string_view name) -> std::optional<Format> {
    const auto n = normalize(name);
    if (n == "yaml" || n == "yml") return Format::yaml;
    if (n == "json") return Format::json;
    return std::nullopt;
}

auto detect_format(std::string_view filename) -> std::optional<Format> {
    const auto n = normalize(filename);
    if (n.ends_with(".yaml") || n.ends_with(".yml")) return Format::yaml;
    if (n.ends_with(".json")) return Format::json;
    return std::nullopt;
}

auto parse_document(std::string_view text, Format format) -> Node {
    auto document = format == Format::yaml ? parse_yaml(text) : parse_json(text);
    if (!document.is_mapping()) {
        throw Exception{ErrorKind::parse_error,
                        std::string{format_label(format)} + " must contain a mapping at root, got " +
                        std::string{to_string_view(document.kind())}};
    }
    return document;
}

auto serialize_document(const Node& document, Format format) -> std::string {
    if (!document.is_mapping()) {
        throw Exception{ErrorKind::serialization_error,
                        "Document must be a mapping, got " +
                        std::string{to_string_view(document.kind())}};
    }
    return format == Format::yaml ? serialize_yaml(document) : serialize_json(document, 2);
}

}  // namespace packops_cpp
