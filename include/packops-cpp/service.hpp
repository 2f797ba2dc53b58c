/// @file service.hpp
/// @brief Text-level entry points for transport layers.
///
/// These functions take document text, a format name and wire-shaped JSON
/// (operations, schema, options) and always return a structured response.
/// Parse, decode and serialization failures become errors in the response;
/// no exception escapes.
///
/// @code
/// auto ops = nlohmann::json::array({
///     {{"action", "update"}, {"path", nlohmann::json::array()},
///      {"updates", {{"version", "2.0.0"}}}},
/// });
/// auto response = packops_cpp::service::transform(text, "yaml", ops);
/// if (response.result.success) std::puts(response.serialized.c_str());
/// @endcode

#pragma once

#include <packops-cpp/executor.hpp>
#include <packops-cpp/node.hpp>
#include <packops-cpp/schema.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace packops_cpp::service {

/// The outcome of transform(): the pipeline result plus the transformed
/// document re-serialized in the request's format (empty on failure).
struct TransformResponse {
    TransformationResult result;
    std::string serialized;
};

/// Parse, transform and re-serialize a document.
/// @param format "yaml", "yml" or "json".
/// @param schema A schema definition; nullopt selects the domain pack schema.
/// @param options A wire options object; nullopt selects the defaults.
auto transform(std::string_view document_text,
               std::string_view format,
               const nlohmann::json& operations,
               const std::optional<nlohmann::json>& schema = std::nullopt,
               const std::optional<nlohmann::json>& options = std::nullopt) -> TransformResponse;

/// Parse a document and validate it; every violation is reported.
auto validate(std::string_view document_text,
              std::string_view format,
              const std::optional<nlohmann::json>& schema = std::nullopt) -> ValidationResult;

/// Dry run of transform(). The transformed document is never returned.
auto preview(std::string_view document_text,
             std::string_view format,
             const nlohmann::json& operations,
             const std::optional<nlohmann::json>& schema = std::nullopt,
             const std::optional<nlohmann::json>& options = std::nullopt) -> PreviewResult;

/// The built-in domain pack schema definition.
auto get_schema() -> Node;

void to_json(nlohmann::json& j, const TransformResponse& response);

}  // namespace packops_cpp::service
