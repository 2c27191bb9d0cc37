/**
 * @file result_reporter.cpp
 * @brief Implementation of result rendering
 *
 * @date 2025
 */

#include "sandrun/reporters/result_reporter.hpp"

#include <cstring>
#include <sstream>

using json = nlohmann::json;

namespace sandrun {
namespace reporters {

namespace {

std::string SignalName(int sig) {
    const char* description = strsignal(sig);
    return description ? description : "unknown";
}

} // anonymous namespace

ResultReporter::ResultReporter(const ResultReporterConfig& config)
    : config_(config) {
}

json ResultReporter::ToJson(const core::ExecutionResult& result) {
    json j;
    j["exit_code"] = result.exit_code;
    j["stdout"] = result.stdout_output;
    j["stderr"] = result.stderr_output;
    j["timed_out"] = result.timed_out;
    j["backend_used"] = core::ToString(result.backend_used);
    j["requested_mode"] = core::ToString(result.requested_mode);
    j["fell_back"] = result.fell_back;
    j["term_signal"] = result.term_signal;
    j["oom_killed"] = result.oom_killed;
    j["stdout_truncated"] = result.stdout_truncated;
    j["stderr_truncated"] = result.stderr_truncated;
    j["duration_ms"] = result.duration.count();
    return j;
}

std::string ResultReporter::GenerateJsonString(const core::ExecutionResult& result) const {
    const int indent = config_.pretty_print ? config_.indent_size : -1;
    return ToJson(result).dump(indent, ' ', false, json::error_handler_t::replace);
}

std::string ResultReporter::Describe(const core::ExecutionResult& result) {
    std::ostringstream oss;

    if (result.timed_out) {
        oss << "killed after timeout";
    } else if (result.term_signal != 0) {
        oss << "killed by signal " << result.term_signal << " (" << SignalName(result.term_signal) << ")";
    } else {
        oss << "exited with " << result.exit_code;
    }

    if (result.oom_killed) {
        oss << ", out of memory";
    }

    oss << " [" << core::ToString(result.backend_used);
    if (result.fell_back) {
        oss << ", fell back from " << core::ToString(result.requested_mode);
    }
    oss << ", " << result.duration.count() << " ms]";

    return oss.str();
}

} // namespace reporters
} // namespace sandrun
