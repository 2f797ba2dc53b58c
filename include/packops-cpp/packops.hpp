/// @file packops.hpp
/// @brief Umbrella header for the packops-cpp library.
///
/// Include this single header for access to all public types:
/// Node, Path, Operation, Schema, SafetyIssue, Diff, the executor,
/// the JSON/YAML codecs and the service entry points.

#pragma once

#include <packops-cpp/diff.hpp>
#include <packops-cpp/error.hpp>
#include <packops-cpp/executor.hpp>
#include <packops-cpp/format.hpp>
#include <packops-cpp/json.hpp>
#include <packops-cpp/node.hpp>
#include <packops-cpp/operation.hpp>
#include <packops-cpp/path.hpp>
#include <packops-cpp/safety.hpp>
#include <packops-cpp/schema.hpp>
#include <packops-cpp/service.hpp>
#include <packops-cpp/yaml.hpp>
