/**
 * @file execution_backend.hpp
 * @brief Interface implemented by every isolation strategy
 *
 * @date 2025
 */

#pragma once

#include "sandrun/core/execution_types.hpp"
#include "sandrun/core/result_normalizer.hpp"
#include "sandrun/monitors/process_launcher.hpp"

namespace sandrun {
namespace backends {

/**
 * @class ExecutionBackend
 * @brief Runs one request under one isolation strategy
 *
 * Implementations receive a request and config already validated by
 * SandboxExecutor and return what they observed. They never decide exit
 * codes; core::NormalizeResult does.
 */
class ExecutionBackend {
public:
    virtual ~ExecutionBackend() = default;

    /// Mode this backend implements.
    virtual core::ExecutionMode Mode() const = 0;

    /**
     * @brief Run the request to completion
     * @throws core::EnvironmentError if the process cannot be started
     */
    virtual core::RawTermination Run(const core::ExecutionRequest& request,
                                     const core::ExecutionConfig& config) const = 0;

protected:
    /// Local launch of request.program with the config's directory and environment.
    static monitors::LaunchOptions MakeLaunchOptions(const core::ExecutionRequest& request,
                                                     const core::ExecutionConfig& config,
                                                     bool new_process_group);
};

} // namespace backends
} // namespace sandrun
