#pragma once

// Global work-stealing executor via Taskflow.
//
// Provides a process-global tf::Executor singleton sized to
// std::thread::hardware_concurrency(). Batch runs submit one task per
// matched document through this executor.
//
// Internal header, not installed.

#include <taskflow/taskflow.hpp>

namespace jsonpatch_cpp::detail {

// Process-global executor. Created on first use, destroyed at exit.
inline auto global_executor() -> tf::Executor& {
    static auto executor = tf::Executor{};
    return executor;
}

}  // namespace jsonpatch_cpp::detail
