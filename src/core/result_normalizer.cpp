/**
 * @file result_normalizer.cpp
 * @brief Implementation of result normalization
 *
 * @date 2025
 */

#include "sandrun/core/result_normalizer.hpp"

namespace sandrun {
namespace core {

ExecutionResult NormalizeResult(const RawTermination& raw) {
    ExecutionResult result;
    result.backend_used = raw.backend;
    result.requested_mode = raw.backend;
    result.stdout_output = raw.output.out.data;
    result.stderr_output = raw.output.err.data;
    result.stdout_truncated = raw.output.out.truncated;
    result.stderr_truncated = raw.output.err.truncated;
    result.oom_killed = raw.oom_killed;
    result.duration = raw.duration;
    result.term_signal = raw.status.exited ? 0 : raw.status.term_signal;

    if (raw.timeout_fired) {
        // A process that handled SIGTERM and exited cleanly still timed out
        result.timed_out = true;
        result.exit_code = kKilledExitCode;
    } else if (raw.status.exited) {
        result.exit_code = raw.status.exit_code;
    } else {
        result.exit_code = kKilledExitCode;
    }

    return result;
}

} // namespace core
} // namespace sandrun
