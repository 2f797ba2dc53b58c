/// @file format.hpp
/// @brief Document text formats and format-dispatched parsing/serialization.

#pragma once

#include <packops-cpp/node.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace packops_cpp {

/// A supported document text format.
enum class Format : std::uint8_t {
    yaml,
    json,
};

/// Convert a Format to its canonical name ("yaml" or "json").
constexpr auto to_string_view(Format format) noexcept -> std::string_view {
    switch (format) {
        case Format::yaml: return "yaml";
        case Format::json: return "json";
    }
    return "unknown";
}

/// Parse a format name: "yaml", "yml" or "json", case-insensitive, with
/// surrounding whitespace ignored. Returns nullopt for anything else.
auto parse_format(std::string_view name) -> std::optional<Format>;

/// The format implied by a filename extension (.yaml, .yml, .json).
auto detect_format(std::string_view filename) -> std::optional<Format>;

/// Parse document text. The root must be a mapping.
/// @throws Exception (parse_error).
auto parse_document(std::string_view text, Format format) -> Node;

/// Serialize a document: JSON with 2-space indent, YAML in block style.
/// @throws Exception (serialization_error), also for a non-mapping root.
auto serialize_document(const Node& document, Format format) -> std::string;

}  // namespace packops_cpp
