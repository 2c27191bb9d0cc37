/**
 * @file execution_types.hpp
 * @brief Value types shared by the executor, its backends and its callers
 *
 * ExecutionConfig and ExecutionRequest are built per invocation and never
 * shared between calls. ExecutionResult is the single result shape returned
 * whichever backend actually ran the command.
 *
 * @date 2025
 */

#pragma once

#include <sys/types.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sandrun {
namespace core {

/// Exit code reported when the process was killed instead of exiting.
constexpr int kKilledExitCode = -1;

/**
 * @enum ExecutionMode
 * @brief Isolation strategy used to run a command
 */
enum class ExecutionMode {
    NONE,       ///< Direct execution, no supervision (trusted commands only)
    SPAWN,      ///< Supervised child process, no container isolation
    CONTAINER   ///< Inside a container runtime, falls back to SPAWN
};

/**
 * @enum CodeLanguage
 * @brief Interpreters available to SandboxExecutor::ExecuteCode
 */
enum class CodeLanguage {
    PYTHON,
    NODE,
    BASH
};

/// Lower-case name of a mode ("none", "spawn", "container").
std::string ToString(ExecutionMode mode);

/**
 * @brief Parse a mode name
 *
 * Accepts "none", "spawn", "container" and "docker" (alias of container),
 * case-insensitively.
 *
 * @throws ConfigurationError for any other name
 */
ExecutionMode ParseExecutionMode(const std::string& name);

std::string ToString(CodeLanguage language);

/**
 * @brief Parse a language name ("python", "node", "bash")
 * @throws ConfigurationError for unsupported languages
 */
CodeLanguage ParseCodeLanguage(const std::string& name);

/**
 * @struct ContainerSettings
 * @brief How the container backend invokes the runtime
 *
 * All capabilities are dropped and no-new-privileges is always set; these
 * are not configurable.
 */
struct ContainerSettings {
    std::string runtime{"docker"};          ///< Runtime CLI binary
    std::string image{"alpine:latest"};     ///< Image the command runs in
    std::size_t memory_limit_mb{256};       ///< Memory limit, swap disabled
    int cpu_quota_percent{50};              ///< Share of one CPU
    int pids_limit{50};                     ///< Maximum processes in the container
    bool network_enabled{false};            ///< false: --network none, true: bridge
    bool read_only_root{false};             ///< Read-only rootfs and workspace mount
    std::string mount_point{"/workspace"};  ///< Where the working directory is mounted
};

/**
 * @struct ExecutionConfig
 * @brief How to run one command
 */
struct ExecutionConfig {
    ExecutionMode mode{ExecutionMode::SPAWN};

    /// Absent means no deadline. Must be positive when present.
    std::optional<std::chrono::milliseconds> timeout;

    /// Absent means the caller's current directory. Must exist when present.
    std::optional<std::filesystem::path> working_directory;

    /// Added to (or overriding) the inherited environment.
    std::map<std::string, std::string> environment;

    /// Per-stream capture cap. Excess output is drained and discarded and the
    /// matching *_truncated flag is set. Absent means unlimited.
    std::optional<std::size_t> max_output_bytes;

    ContainerSettings container;
};

/**
 * @struct ExecutionRequest
 * @brief Program and argument vector, never interpreted by a shell
 */
struct ExecutionRequest {
    std::string program;
    std::vector<std::string> args;

    /// Called with the child's pid once it is running. Lets a caller cancel
    /// through SandboxExecutor::TerminateProcessTree.
    std::function<void(pid_t)> on_started;
};

/**
 * @struct ExecutionResult
 * @brief Canonical outcome of a command, independent of the backend
 *
 * Invariant: timed_out implies exit_code == kKilledExitCode.
 */
struct ExecutionResult {
    int exit_code{0};                 ///< Real exit code or kKilledExitCode
    std::string stdout_output;        ///< Captured standard output
    std::string stderr_output;        ///< Captured standard error
    bool timed_out{false};            ///< Killed by the timeout supervisor
    ExecutionMode backend_used{ExecutionMode::SPAWN};    ///< Backend that ran it
    ExecutionMode requested_mode{ExecutionMode::SPAWN};  ///< Backend that was asked for
    bool fell_back{false};            ///< Container requested but unavailable
    int term_signal{0};               ///< Terminating signal, 0 if it exited
    bool oom_killed{false};           ///< Container runtime reported an OOM kill
    bool stdout_truncated{false};     ///< stdout exceeded max_output_bytes
    bool stderr_truncated{false};     ///< stderr exceeded max_output_bytes
    std::chrono::milliseconds duration{0};  ///< Wall-clock time of the run

    bool Succeeded() const { return !timed_out && exit_code == 0; }
};

/**
 * @class ExecutionConfigBuilder
 * @brief Fluent construction of ExecutionConfig
 *
 * @code
 * auto config = ExecutionConfigBuilder()
 *     .WithMode(ExecutionMode::CONTAINER)
 *     .WithTimeout(std::chrono::seconds(30))
 *     .WithWorkingDirectory("/srv/project")
 *     .WithImage("python:3.13-alpine")
 *     .Build();
 * @endcode
 */
class ExecutionConfigBuilder {
public:
    ExecutionConfigBuilder& WithMode(ExecutionMode mode) {
        config_.mode = mode;
        return *this;
    }

    ExecutionConfigBuilder& WithTimeout(std::chrono::milliseconds timeout) {
        config_.timeout = timeout;
        return *this;
    }

    ExecutionConfigBuilder& WithoutTimeout() {
        config_.timeout.reset();
        return *this;
    }

    ExecutionConfigBuilder& WithWorkingDirectory(const std::filesystem::path& dir) {
        config_.working_directory = dir;
        return *this;
    }

    ExecutionConfigBuilder& WithEnvironment(const std::string& key, const std::string& value) {
        config_.environment[key] = value;
        return *this;
    }

    ExecutionConfigBuilder& WithMaxOutputBytes(std::size_t bytes) {
        config_.max_output_bytes = bytes;
        return *this;
    }

    ExecutionConfigBuilder& WithImage(const std::string& image) {
        config_.container.image = image;
        return *this;
    }

    ExecutionConfigBuilder& WithRuntime(const std::string& runtime) {
        config_.container.runtime = runtime;
        return *this;
    }

    ExecutionConfigBuilder& WithMemoryLimit(std::size_t mb) {
        config_.container.memory_limit_mb = mb;
        return *this;
    }

    ExecutionConfigBuilder& WithNetwork(bool enabled = true) {
        config_.container.network_enabled = enabled;
        return *this;
    }

    ExecutionConfigBuilder& WithReadOnlyRoot(bool read_only = true) {
        config_.container.read_only_root = read_only;
        return *this;
    }

    ExecutionConfig Build() const {
        return config_;
    }

private:
    ExecutionConfig config_;
};

} // namespace core
} // namespace sandrun
