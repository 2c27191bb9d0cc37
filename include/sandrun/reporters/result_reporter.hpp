/**
 * @file result_reporter.hpp
 * @brief JSON and one-line text rendering of ExecutionResult
 *
 * @date 2025
 */

#pragma once

#include "sandrun/core/execution_types.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace sandrun {
namespace reporters {

/**
 * @struct ResultReporterConfig
 * @brief Output options
 */
struct ResultReporterConfig {
    bool pretty_print{true};   ///< Indent JSON output
    int indent_size{2};        ///< Spaces per indent level
};

/**
 * @class ResultReporter
 * @brief Renders execution results for humans and machines
 *
 * **JSON keys**: exit_code, stdout, stderr, timed_out, backend_used,
 * requested_mode, fell_back, term_signal, oom_killed, stdout_truncated,
 * stderr_truncated, duration_ms.
 *
 * **Usage Example**:
 * @code
 * ResultReporter reporter;
 * std::cout << reporter.GenerateJsonString(result) << std::endl;
 * spdlog::info("{}", ResultReporter::Describe(result));
 * @endcode
 */
class ResultReporter {
public:
    explicit ResultReporter(const ResultReporterConfig& config = ResultReporterConfig{});

    static nlohmann::json ToJson(const core::ExecutionResult& result);

    /**
     * @brief Serialized JSON document
     *
     * Bytes that are not valid UTF-8 in the captured streams are replaced
     * with U+FFFD instead of failing the whole report.
     */
    std::string GenerateJsonString(const core::ExecutionResult& result) const;

    /**
     * @brief One status line
     *
     * "exited with 0", "killed by signal 9 (SIGKILL)" or
     * "killed after timeout", plus the backend and fallback note.
     */
    static std::string Describe(const core::ExecutionResult& result);

private:
    ResultReporterConfig config_;
};

} // namespace reporters
} // namespace sandrun
