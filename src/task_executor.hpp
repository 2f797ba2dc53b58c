#pragma once

// Process-global work-stealing executor via Taskflow.
//
// Sized to std::thread::hardware_concurrency(). execute_all() submits one
// task per transformation request through it.
//
// Internal header, not installed.

#include <taskflow/taskflow.hpp>
#include <taskflow/algorithm/for_each.hpp>

namespace packops_cpp::detail {

// Created on first use, destroyed at exit.
inline auto global_executor() -> tf::Executor& {
    static auto executor = tf::Executor{};
    return executor;
}

}  // namespace packops_cpp::detail
