#include <packops-cpp/service.hpp>

#include <packops-cpp/format.hpp>
#include <packops-cpp/json.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace packops_cpp::service {

namespace {

/// A request argument that could not be decoded, already shaped as the
/// error the caller receives.
class RequestError : public std::runtime_error {
public:
    explicit RequestError(TransformationError error)
        : std::runtime_error{error.message}, error_{std::move(error)} {}

    auto error() const noexcept -> const TransformationError& { return error_; }

private:
    TransformationError error_;
};

auto reject(std::string_view code, std::string message, Phase phase,
            Mapping context = {}) -> RequestError {
    return RequestError{TransformationError{
        .code = std::string{code},
        .message = std::move(message),
        .phase = phase,
        .context = std::move(context),
    }};
}

// -- Argument decoding --------------------------------------------------------

auto read_format(std::string_view name) -> Format {
    if (auto format = parse_format(name)) return *format;
    throw reject("UNSUPPORTED_FORMAT",
                 "Unsupported format: " + std::string{name} + ". Use 'yaml' or 'json'",
                 Phase::parsing);
}

auto read_document(std::string_view text, Format format) -> Node {
    try {
        return parse_document(text, format);
    } catch (const Exception& e) {
        throw reject(error_code(e.kind()), e.what(), Phase::parsing);
    }
}

auto read_schema(const std::optional<nlohmann::json>& schema) -> std::optional<Schema> {
    if (!schema) return std::nullopt;
    try {
        return Schema{schema->get<Node>()};
    } catch (const Exception& e) {
        throw reject("INVALID_SCHEMA", std::string{"Invalid schema: "} + e.what(),
                     Phase::input_validation);
    }
}

auto read_options(const std::optional<nlohmann::json>& options) -> ExecutionOptions {
    if (!options || options->is_null()) return ExecutionOptions{};
    try {
        return options->get<ExecutionOptions>();
    } catch (const Exception& e) {
        throw reject(error_code(e.kind()), std::string{"Invalid options: "} + e.what(),
                     Phase::input_validation);
    } catch (const nlohmann::json::exception& e) {
        throw reject("INVALID_INPUT", std::string{"Invalid options: "} + e.what(),
                     Phase::input_validation);
    }
}

auto read_operations(const nlohmann::json& operations) -> std::vector<Operation> {
    try {
        return operations_from_json(operations);
    } catch (const BatchError& e) {
        throw reject(error_code(e.cause().kind), e.what(), Phase::input_validation,
                     Mapping{{"operation_index",
                              Node{static_cast<std::int64_t>(e.operation_index())}}});
    } catch (const Exception& e) {
        throw reject(error_code(e.kind()), e.what(), Phase::input_validation);
    } catch (const nlohmann::json::exception& e) {
        throw reject("INVALID_INPUT", std::string{"Invalid operations: "} + e.what(),
                     Phase::input_validation);
    }
}

auto wire_count(const nlohmann::json& operations) -> std::size_t {
    return operations.is_array() ? operations.size() : 0;
}

/// Everything transform() and preview() need before the pipeline runs.
struct Request {
    Format format{Format::yaml};
    Node document{Mapping{}};
    std::optional<Schema> schema;
    ExecutionOptions options;
    std::vector<Operation> operations;
};

/// Decode in argument order. `request.document` holds the parsed document
/// as soon as it is available, so a later failure can still return it.
void decode(Request& request,
            std::string_view document_text,
            std::string_view format,
            const nlohmann::json& operations,
            const std::optional<nlohmann::json>& schema,
            const std::optional<nlohmann::json>& options) {
    request.format = read_format(format);
    request.document = read_document(document_text, request.format);
    request.schema = read_schema(schema);
    request.options = read_options(options);
    request.operations = read_operations(operations);
}

auto schema_of(const Request& request) -> const Schema& {
    return request.schema ? *request.schema : Schema::domain_pack();
}

}  // anonymous namespace

auto transform(std::string_view document_text,
               std::string_view format,
               const nlohmann::json& operations,
               const std::optional<nlohmann::json>& schema,
               const std::optional<nlohmann::json>& options) -> TransformResponse {
    auto request = Request{};
    try {
        decode(request, document_text, format, operations, schema, options);
    } catch (const RequestError& e) {
        auto response = TransformResponse{};
        response.result.document = std::move(request.document);
        response.result.errors.push_back(e.error());
        response.result.metadata.operation_count = wire_count(operations);
        response.result.metadata.failed_phase = e.error().phase;
        return response;
    }

    auto response = TransformResponse{
        .result = execute_transformation(request.document, request.operations,
                                         schema_of(request), request.options),
    };
    if (!response.result.success) return response;

    try {
        response.serialized = serialize_document(response.result.document, request.format);
    } catch (const Exception& e) {
        auto& result = response.result;
        result.success = false;
        result.document = std::move(request.document);
        result.diff.reset();
        result.errors.push_back(TransformationError{
            .code = std::string{error_code(e.kind())},
            .message = e.what(),
            .phase = Phase::serialization,
        });
        result.metadata.failed_phase = Phase::serialization;
    }
    return response;
}

auto validate(std::string_view document_text,
              std::string_view format,
              const std::optional<nlohmann::json>& schema) -> ValidationResult {
    auto document = Node{};
    auto custom = std::optional<Schema>{};
    try {
        document = read_document(document_text, read_format(format));
        custom = read_schema(schema);
    } catch (const RequestError& e) {
        return ValidationResult{
            .valid = false,
            .errors = {ValidationError{
                .code = e.error().code,
                .message = e.error().message,
                .phase = std::string{to_string_view(e.error().phase)},
            }},
        };
    }

    const auto& active = custom ? *custom : Schema::domain_pack();
    auto result = ValidationResult{};
    for (const auto& violation : active.collect_violations(document)) {
        result.valid = false;
        result.errors.push_back(ValidationError{
            .code = "VALIDATION_ERROR",
            .message = violation.describe(),
            .phase = "validation",
        });
    }
    return result;
}

auto preview(std::string_view document_text,
             std::string_view format,
             const nlohmann::json& operations,
             const std::optional<nlohmann::json>& schema,
             const std::optional<nlohmann::json>& options) -> PreviewResult {
    auto request = Request{};
    try {
        decode(request, document_text, format, operations, schema, options);
    } catch (const RequestError& e) {
        auto result = PreviewResult{};
        result.errors.push_back(e.error());
        result.operation_count = wire_count(operations);
        return result;
    }
    return preview_transformation(request.document, request.operations,
                                  schema_of(request), request.options);
}

auto get_schema() -> Node {
    return Schema::domain_pack().definition();
}

void to_json(nlohmann::json& j, const TransformResponse& response) {
    packops_cpp::to_json(j, response.result);
    j["serialized"] = response.serialized;
}

}  // namespace packops_cpp::service
