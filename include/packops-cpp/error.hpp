/// @file error.hpp
/// @brief Error types for the packops-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace packops_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    invalid_input,        ///< A caller-supplied argument has the wrong shape.
    invalid_path_syntax,  ///< A path string does not follow the path grammar.
    path_not_found,       ///< A key or index along a path does not exist.
    index_out_of_bounds,  ///< A sequence index is past the end.
    type_mismatch,        ///< A container of the wrong kind was encountered.
    key_already_exists,   ///< An add would replace a non-sequence value.
    not_an_object,        ///< An update targeted something other than a mapping.
    assertion_failed,     ///< An assert operation did not hold.
    unknown_action,       ///< An operation names an unsupported action.
    invalid_operation,    ///< An operation is invalid in the current context.
    schema_violation,     ///< A document does not satisfy its schema.
    invalid_schema,       ///< A schema definition is malformed.
    parse_error,          ///< Document text could not be parsed.
    serialization_error,  ///< A document could not be serialized.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::invalid_input:       return "invalid_input";
        case ErrorKind::invalid_path_syntax: return "invalid_path_syntax";
        case ErrorKind::path_not_found:      return "path_not_found";
        case ErrorKind::index_out_of_bounds: return "index_out_of_bounds";
        case ErrorKind::type_mismatch:       return "type_mismatch";
        case ErrorKind::key_already_exists:  return "key_already_exists";
        case ErrorKind::not_an_object:       return "not_an_object";
        case ErrorKind::assertion_failed:    return "assertion_failed";
        case ErrorKind::unknown_action:      return "unknown_action";
        case ErrorKind::invalid_operation:   return "invalid_operation";
        case ErrorKind::schema_violation:    return "schema_violation";
        case ErrorKind::invalid_schema:      return "invalid_schema";
        case ErrorKind::parse_error:         return "parse_error";
        case ErrorKind::serialization_error: return "serialization_error";
    }
    return "unknown";
}

/// The upper-case wire code reported for an ErrorKind (e.g. "PATH_NOT_FOUND").
constexpr auto error_code(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::invalid_input:       return "INVALID_INPUT";
        case ErrorKind::invalid_path_syntax: return "INVALID_PATH_SYNTAX";
        case ErrorKind::path_not_found:      return "PATH_NOT_FOUND";
        case ErrorKind::index_out_of_bounds: return "INDEX_OUT_OF_BOUNDS";
        case ErrorKind::type_mismatch:       return "TYPE_MISMATCH";
        case ErrorKind::key_already_exists:  return "KEY_ALREADY_EXISTS";
        case ErrorKind::not_an_object:       return "NOT_AN_OBJECT";
        case ErrorKind::assertion_failed:    return "ASSERTION_FAILED";
        case ErrorKind::unknown_action:      return "UNKNOWN_ACTION";
        case ErrorKind::invalid_operation:   return "INVALID_OPERATION";
        case ErrorKind::schema_violation:    return "SCHEMA_VIOLATION";
        case ErrorKind::invalid_schema:      return "INVALID_SCHEMA";
        case ErrorKind::parse_error:         return "PARSE_ERROR";
        case ErrorKind::serialization_error: return "SERIALIZATION_ERROR";
    }
    return "UNKNOWN_ERROR";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Exception thrown by the path resolver, the operation engine and the
/// codecs. The executor and the service layer convert it back into a
/// structured error; it never crosses those boundaries.
class Exception : public std::runtime_error {
public:
    explicit Exception(Error error)
        : std::runtime_error{error.message}, error_{std::move(error)} {}

    Exception(ErrorKind kind, std::string message)
        : Exception{Error{kind, std::move(message)}} {}

    auto kind() const noexcept -> ErrorKind { return error_.kind; }
    auto error() const noexcept -> const Error& { return error_; }

private:
    Error error_;
};

}  // namespace packops_cpp
