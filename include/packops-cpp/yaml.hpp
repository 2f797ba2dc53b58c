/// @file yaml.hpp
/// @brief yaml-cpp interoperability for packops-cpp.
///
/// Plain scalars are typed with the YAML 1.2 core schema (null, booleans,
/// integers, floats); quoted scalars are always strings. Emission quotes any
/// string that would otherwise read back as a different type, so
/// `parse_yaml(serialize_yaml(d)) == d`.

#pragma once

#include <packops-cpp/node.hpp>

#include <string>
#include <string_view>

namespace packops_cpp {

/// Parse YAML text into a Node (any root kind).
/// @throws Exception (parse_error) for malformed or empty input, or a
///   mapping key that is not a scalar.
auto parse_yaml(std::string_view text) -> Node;

/// Emit a document in block style.
/// @throws Exception (serialization_error).
auto serialize_yaml(const Node& node) -> std::string;

}  // namespace packops_cpp
