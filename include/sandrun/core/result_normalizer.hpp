/**
 * @file result_normalizer.hpp
 * @brief Folds a backend's raw termination data into ExecutionResult
 *
 * @date 2025
 */

#pragma once

#include "sandrun/core/execution_types.hpp"
#include "sandrun/monitors/process_launcher.hpp"

#include <chrono>

namespace sandrun {
namespace core {

/**
 * @struct RawTermination
 * @brief What a backend observed, before interpretation
 */
struct RawTermination {
    ExecutionMode backend{ExecutionMode::SPAWN};
    monitors::WaitStatus status;          ///< Decoded wait status of the direct child
    bool timeout_fired{false};            ///< The supervisor terminated the process
    monitors::CapturedOutput output;
    bool oom_killed{false};
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Build the canonical result from what a backend observed
 *
 * Single place where exit codes are decided. requested_mode and fell_back
 * are left for the caller to fill in.
 *
 * | Observation             | exit_code         | timed_out | term_signal |
 * |-------------------------|-------------------|-----------|-------------|
 * | timeout fired           | kKilledExitCode   | true      | as observed |
 * | killed by a signal      | kKilledExitCode   | false     | signal      |
 * | exited                  | real exit code    | false     | 0           |
 */
ExecutionResult NormalizeResult(const RawTermination& raw);

} // namespace core
} // namespace sandrun
