#include <packops-cpp/schema.hpp>
#include <packops-cpp/json.hpp>

#include <nlohmann/json-schema.hpp>

#include <cmath>
#include <exception>
#include <iterator>
#include <string>
#include <utility>

namespace packops_cpp {

namespace {

// The closed domain pack schema (JSON Schema draft-07 subset).
constexpr auto domain_pack_schema_json = std::string_view{R"json(
{
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "required": ["name", "description", "version"],
  "additionalProperties": false,
  "properties": {
    "name": {"type": "string", "minLength": 1, "description": "Domain pack name"},
    "description": {"type": "string", "minLength": 1, "description": "Domain pack description"},
    "version": {
      "type": "string",
      "pattern": "^\\d+\\.\\d+\\.\\d+$",
      "description": "Semantic version (e.g. 3.0.0)"
    },
    "entities": {
      "type": "array",
      "items": {
        "type": "object",
        "required": ["name", "type", "attributes"],
        "additionalProperties": false,
        "properties": {
          "name": {"type": "string", "minLength": 1},
          "type": {"type": "string", "minLength": 1},
          "attributes": {"type": "array", "items": {"type": "string"}, "minItems": 1},
          "synonyms": {"type": "array", "items": {"type": "string"}}
        }
      }
    },
    "key_terms": {
      "type": "array",
      "items": {"type": "string", "minLength": 1}
    },
    "entity_aliases": {
      "type": "object",
      "additionalProperties": {"type": "array", "items": {"type": "string"}}
    },
    "extraction_patterns": {
      "type": "array",
      "items": {
        "type": "object",
        "required": ["pattern", "entity_type", "attribute", "confidence"],
        "additionalProperties": false,
        "properties": {
          "pattern": {"type": "string", "minLength": 1},
          "entity_type": {"type": "string", "minLength": 1},
          "attribute": {"type": "string", "minLength": 1},
          "confidence": {"type": "number", "minimum": 0.0, "maximum": 1.0}
        }
      }
    },
    "business_context": {
      "type": "object",
      "additionalProperties": {"type": "array", "items": {"type": "string"}}
    },
    "relationship_types": {
      "type": "array",
      "items": {
        "type": "object",
        "required": ["type", "business_context"],
        "additionalProperties": false,
        "properties": {
          "type": {"type": "string", "minLength": 1},
          "business_context": {
            "type": "object",
            "additionalProperties": {"type": "boolean"}
          }
        }
      }
    },
    "relationships": {
      "type": "array",
      "items": {
        "type": "object",
        "required": ["name", "from", "to", "attributes"],
        "additionalProperties": false,
        "properties": {
          "name": {"type": "string", "minLength": 1},
          "from": {"type": "string", "minLength": 1},
          "to": {"type": "string", "minLength": 1},
          "attributes": {"type": "array", "items": {"type": "string"}},
          "synonyms": {"type": "array", "items": {"type": "string"}}
        }
      }
    },
    "business_patterns": {
      "type": "array",
      "items": {
        "type": "object",
        "required": ["name", "description", "stages"],
        "additionalProperties": false,
        "properties": {
          "name": {"type": "string", "minLength": 1},
          "description": {"type": "string", "minLength": 1},
          "stages": {"type": "array", "items": {"type": "string"}, "minItems": 1},
          "triggers": {"type": "array", "items": {"type": "string"}},
          "entities_involved": {"type": "array", "items": {"type": "string"}},
          "tags": {"type": "array", "items": {"type": "string"}},
          "decision_points": {"type": "array", "items": {"type": "string"}}
        }
      }
    },
    "reasoning_templates": {
      "type": "array",
      "items": {
        "type": "object",
        "required": ["name", "steps", "triggers", "confidence_threshold"],
        "additionalProperties": false,
        "properties": {
          "name": {"type": "string", "minLength": 1},
          "steps": {"type": "object", "additionalProperties": {"type": "string"}},
          "triggers": {"type": "array", "items": {"type": "string"}, "minItems": 1},
          "confidence_threshold": {"type": "number", "minimum": 0.0, "maximum": 1.0}
        }
      }
    },
    "multihop_questions": {
      "type": "array",
      "items": {
        "type": "object",
        "required": ["template", "examples", "priority", "reasoning_type"],
        "additionalProperties": false,
        "properties": {
          "template": {"type": "string", "minLength": 1},
          "examples": {"type": "array", "items": {"type": "string"}, "minItems": 1},
          "priority": {"type": "string", "enum": ["low", "medium", "high", "critical"]},
          "reasoning_type": {"type": "string", "minLength": 1}
        }
      }
    },
    "question_templates": {
      "type": "object",
      "additionalProperties": {
        "type": "array",
        "items": {
          "type": "object",
          "required": ["template", "priority", "expected_answer_type"],
          "properties": {
            "template": {"type": "string", "minLength": 1},
            "priority": {"type": "string", "enum": ["low", "medium", "high", "critical"]},
            "expected_answer_type": {"type": "string", "minLength": 1},
            "entity_types": {"type": "array", "items": {"type": "string"}},
            "attributes": {"type": "array", "items": {"type": "string"}},
            "entity_pairs": {
              "type": "array",
              "items": {"type": "array", "items": {"type": "string"}}
            },
            "process_types": {"type": "array", "items": {"type": "string"}},
            "financial_types": {"type": "array", "items": {"type": "string"}}
          }
        }
      }
    },
    "business_rules": {
      "type": "array",
      "items": {
        "type": "object",
        "required": ["name", "description", "rules"],
        "additionalProperties": false,
        "properties": {
          "name": {"type": "string", "minLength": 1},
          "description": {"type": "string", "minLength": 1},
          "rules": {"type": "array", "items": {"type": "string"}, "minItems": 1}
        }
      }
    },
    "validation_rules": {
      "type": "object",
      "additionalProperties": {
        "type": "object",
        "additionalProperties": {"type": "array", "items": {"type": "string"}}
      }
    }
  }
}
)json"};

// The library matches `pattern` with std::regex, whose stack use grows
// with the subject length. Longer strings at pattern-checked locations are
// reported without being matched.
constexpr auto max_pattern_subject = std::size_t{4096};

[[noreturn]] void schema_error(const std::string& what) {
    throw Exception{ErrorKind::invalid_schema, "invalid schema: " + what};
}

auto type_names(const Node& keyword) -> std::vector<std::string> {
    if (keyword.is_string()) return {keyword.as_string()};
    auto names = std::vector<std::string>{};
    if (keyword.is_sequence()) {
        for (const auto& name : keyword.as_sequence()) {
            if (name.is_string()) names.push_back(name.as_string());
        }
    }
    return names;
}

/// The sub-schema that governs `path`, following `properties`,
/// `additionalProperties` and `items`.
auto subschema_at(const Node& definition, const Path& path) -> const Node* {
    const Node* current = &definition;
    for (const auto& segment : path) {
        if (!current->is_mapping()) return nullptr;
        const Node* next = nullptr;
        if (const auto* key = std::get_if<KeySegment>(&segment)) {
            if (const auto* props = current->find("properties"); props && props->is_mapping()) {
                next = props->find(key->key);
            }
            if (!next) {
                const auto* additional = current->find("additionalProperties");
                if (additional && additional->is_mapping()) next = additional;
            }
        } else {
            next = current->find("items");
        }
        if (!next) return nullptr;
        current = next;
    }
    return current->is_mapping() ? current : nullptr;
}

// -- Error collection -----------------------------------------------------------

/// Decode a JSON pointer against the instance it points into, so that
/// array positions become index segments.
auto pointer_to_path(const nlohmann::json::json_pointer& pointer,
                     const nlohmann::json& instance) -> Path {
    auto path = Path{};
    const auto text = pointer.to_string();
    const nlohmann::json* current = &instance;
    auto pos = std::size_t{0};
    while (pos < text.size()) {
        const auto next = text.find('/', pos + 1);
        auto token = text.substr(pos + 1, next == std::string::npos ? std::string::npos
                                                                    : next - pos - 1);
        for (auto at = token.find('~'); at != std::string::npos; at = token.find('~', at + 1)) {
            if (at + 1 < token.size() && token[at + 1] == '1') token.replace(at, 2, "/");
            else if (at + 1 < token.size() && token[at + 1] == '0') token.replace(at, 2, "~");
        }

        if (current && current->is_array()) {
            const auto index = static_cast<std::size_t>(std::stoull(token));
            path.push_back(IndexSegment{index});
            current = index < current->size() ? &(*current)[index] : nullptr;
        } else {
            path.push_back(KeySegment{token});
            current = (current && current->is_object() && current->contains(token))
                ? &current->at(token) : nullptr;
        }
        pos = next == std::string::npos ? text.size() : next;
    }
    return path;
}

class CollectingErrorHandler : public nlohmann::json_schema::basic_error_handler {
public:
    explicit CollectingErrorHandler(const nlohmann::json& instance) : instance_{instance} {}

    void error(const nlohmann::json::json_pointer& pointer, const nlohmann::json& value,
               const std::string& message) override {
        nlohmann::json_schema::basic_error_handler::error(pointer, value, message);
        violations_.push_back(SchemaViolation{pointer_to_path(pointer, instance_), message});
    }

    auto violations() -> std::vector<SchemaViolation>& { return violations_; }

private:
    const nlohmann::json& instance_;
    std::vector<SchemaViolation> violations_;
};

/// Values the library would mishandle: strings too long for the pattern
/// matcher, and NaN or infinity where a range is declared (NaN compares
/// false against any bound).
struct Preflight {
    std::vector<SchemaViolation> violations;
    bool oversized{false};
};

void preflight(const Node& value, const Node& definition, Path& path, Preflight& out) {
    if (value.is_string()) {
        if (value.as_string().size() <= max_pattern_subject) return;
        const auto* schema = subschema_at(definition, path);
        if (schema && schema->find("pattern")) {
            out.oversized = true;
            out.violations.push_back(SchemaViolation{
                path, "string of " + std::to_string(value.as_string().size()) +
                      " bytes is too long to match pattern " +
                      dump_json(*schema->find("pattern"))});
        }
    } else if (value.is_real()) {
        if (std::isfinite(value.as_real())) return;
        const auto* schema = subschema_at(definition, path);
        if (schema && (schema->find("minimum") || schema->find("maximum"))) {
            const auto r = value.as_real();
            const auto name = std::isnan(r) ? "NaN" : (r > 0 ? "Infinity" : "-Infinity");
            out.violations.push_back(SchemaViolation{
                path, std::string{name} + " is not a finite number"});
        }
    } else if (value.is_sequence()) {
        const auto& items = value.as_sequence();
        for (std::size_t i = 0; i < items.size(); ++i) {
            path.push_back(IndexSegment{i});
            preflight(items[i], definition, path, out);
            path.pop_back();
        }
    } else if (value.is_mapping()) {
        for (const auto& [key, child] : value.as_mapping()) {
            path.push_back(KeySegment{key});
            preflight(child, definition, path, out);
            path.pop_back();
        }
    }
}

auto validate_with(const Node& document, const Schema& schema,
                   std::string code, std::string phase) -> ValidationResult {
    auto result = ValidationResult{};
    try {
        schema.validate(document);
    } catch (const Exception& e) {
        result.valid = false;
        result.errors.push_back(ValidationError{std::move(code), e.what(), std::move(phase)});
    }
    return result;
}

}  // anonymous namespace

auto SchemaViolation::describe() const -> std::string {
    return "Validation failed at " + (path.empty() ? std::string{"root"} : to_string(path)) +
           ": " + message;
}

auto matches_schema_type(const Node& node, std::string_view type_name) -> bool {
    if (type_name == "null") return node.is_null();
    if (type_name == "boolean") return node.is_bool();
    if (type_name == "integer") {
        return node.is_integer() ||
               (node.is_real() && std::isfinite(node.as_real()) &&
                std::trunc(node.as_real()) == node.as_real());
    }
    if (type_name == "number") return node.is_number();
    if (type_name == "string") return node.is_string();
    if (type_name == "array") return node.is_sequence();
    if (type_name == "object") return node.is_mapping();
    return false;
}

// =============================================================================
// Schema
// =============================================================================

Schema::Schema(Node definition) : definition_{std::move(definition)} {
    if (!definition_.is_mapping()) {
        schema_error("a schema must be an object, got " +
                     std::string{to_string_view(definition_.kind())});
    }
    try {
        validator_ = std::make_shared<const nlohmann::json_schema::json_validator>(
            nlohmann::json(definition_), nullptr,
            nlohmann::json_schema::default_string_format_check);
    } catch (const std::exception& e) {
        schema_error(e.what());
    }
}

auto Schema::domain_pack() -> const Schema& {
    static const auto schema = Schema{parse_json(domain_pack_schema_json)};
    return schema;
}

auto Schema::required_fields() const -> std::vector<std::string> {
    auto fields = std::vector<std::string>{};
    if (const auto* required = definition_.find("required"); required && required->is_sequence()) {
        for (const auto& name : required->as_sequence()) {
            if (name.is_string()) fields.push_back(name.as_string());
        }
    }
    return fields;
}

auto Schema::declared_types(const Path& path) const -> std::vector<std::string> {
    const auto* schema = subschema_at(definition_, path);
    if (!schema) return {};
    if (const auto* type = schema->find("type")) return type_names(*type);
    return {};
}

void Schema::validate(const Node& document) const {
    const auto violations = collect_violations(document);
    if (!violations.empty()) {
        throw Exception{ErrorKind::schema_violation, violations.front().describe()};
    }
}

auto Schema::collect_violations(const Node& document) const -> std::vector<SchemaViolation> {
    auto checked = Preflight{};
    auto path = Path{};
    preflight(document, definition_, path, checked);
    if (checked.oversized) return std::move(checked.violations);

    const auto instance = nlohmann::json(document);
    auto handler = CollectingErrorHandler{instance};
    validator_->validate(instance, handler);
    auto& violations = checked.violations;
    violations.insert(violations.end(),
                      std::make_move_iterator(handler.violations().begin()),
                      std::make_move_iterator(handler.violations().end()));
    return std::move(violations);
}

auto Schema::is_valid(const Node& document) const -> bool {
    return collect_violations(document).empty();
}

auto validate_pre_mutation(const Node& document, const Schema& schema) -> ValidationResult {
    return validate_with(document, schema, "PRE_VALIDATION_FAILED", "pre_mutation");
}

auto validate_post_mutation(const Node& document, const Schema& schema) -> ValidationResult {
    return validate_with(document, schema, "POST_VALIDATION_FAILED", "post_mutation");
}

}  // namespace packops_cpp
