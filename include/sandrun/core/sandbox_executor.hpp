/**
 * @file sandbox_executor.hpp
 * @brief Entry point for running untrusted commands
 *
 * Validates the request, picks the backend for the configured mode (falling
 * back from container to spawn when the runtime is unavailable) and returns
 * one normalized result shape whichever backend ran.
 *
 * @date 2025
 */

#pragma once

#include "sandrun/backends/container_backend.hpp"
#include "sandrun/backends/direct_backend.hpp"
#include "sandrun/backends/spawn_backend.hpp"
#include "sandrun/core/errors.hpp"
#include "sandrun/core/execution_types.hpp"
#include "sandrun/monitors/process_tree.hpp"
#include "sandrun/utils/container_utils.hpp"

#include <sys/types.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace sandrun {
namespace core {

/**
 * @struct ModeResolution
 * @brief Backend chosen for a config
 */
struct ModeResolution {
    ExecutionMode requested{ExecutionMode::SPAWN};
    ExecutionMode resolved{ExecutionMode::SPAWN};
    bool fell_back{false};
};

/**
 * @class SandboxExecutor
 * @brief Sandboxed command execution façade
 *
 * | Mode      | Isolation                    | Timeout   | Fallback |
 * |-----------|------------------------------|-----------|----------|
 * | none      | none, caller's process group | ignored   | -        |
 * | spawn     | own process group            | enforced  | -        |
 * | container | container runtime            | enforced  | spawn    |
 *
 * **Thread Safety**: Execute() may be called concurrently; calls share
 * only the availability probe cache.
 *
 * **Usage Example**:
 * @code
 * SandboxExecutor executor;
 *
 * auto config = ExecutionConfigBuilder()
 *     .WithMode(ExecutionMode::CONTAINER)
 *     .WithTimeout(std::chrono::seconds(10))
 *     .Build();
 *
 * auto result = executor.Execute({"ls", {"-la"}}, config);
 * if (result.timed_out) {
 *     std::cout << "killed after timeout" << std::endl;
 * } else {
 *     std::cout << result.stdout_output;
 * }
 * @endcode
 */
class SandboxExecutor {
public:
    /**
     * @param probe Shared availability probe, a private one is created when null
     */
    explicit SandboxExecutor(std::shared_ptr<utils::ContainerRuntimeProbe> probe = nullptr);

    SandboxExecutor(const SandboxExecutor&) = delete;
    SandboxExecutor& operator=(const SandboxExecutor&) = delete;

    /**
     * @brief Run a program and wait for it
     *
     * A non-zero exit code or a timeout is a normal result.
     *
     * @throws ConfigurationError for an invalid request or config
     * @throws EnvironmentError when the process cannot be started
     */
    ExecutionResult Execute(const ExecutionRequest& request,
                            const ExecutionConfig& config = ExecutionConfig{}) const;

    /**
     * @brief Run a code snippet with the language's interpreter
     *
     * python runs `python3 -c`, node runs `node -e`, bash runs `sh -c`.
     * In container mode the language's image replaces the configured one.
     */
    ExecutionResult ExecuteCode(const std::string& code, CodeLanguage language,
                                const ExecutionConfig& config = ExecutionConfig{}) const;

    /**
     * @brief Whether the container runtime answers (cached, never throws)
     */
    bool IsContainerRuntimeAvailable(const std::string& runtime = ContainerSettings{}.runtime) const;

    /**
     * @brief Decide which backend a config runs on
     *
     * Asks the probe only for container mode.
     */
    ModeResolution ResolveMode(const ExecutionConfig& config) const;

    /**
     * @brief Reject malformed input before anything is spawned
     * @throws ConfigurationError
     */
    static void Validate(const ExecutionRequest& request, const ExecutionConfig& config);

    /**
     * @brief Terminate a process and all of its descendants
     *
     * SIGTERM, wait up to grace, then SIGKILL. Meant for callers that
     * learned the pid through ExecutionRequest::on_started.
     */
    static monitors::TerminationReport TerminateProcessTree(
        pid_t pid, std::chrono::milliseconds grace = monitors::kDefaultGracePeriod);

private:
    ExecutionResult Run(const ExecutionRequest& request, const ExecutionConfig& config,
                        const ModeResolution& resolution) const;

    const backends::ExecutionBackend& BackendFor(ExecutionMode mode) const;

    std::shared_ptr<utils::ContainerRuntimeProbe> probe_;
    backends::DirectBackend direct_backend_;
    backends::SpawnBackend spawn_backend_;
    backends::ContainerBackend container_backend_;
};

} // namespace core
} // namespace sandrun
