/**
 * @file spawn_backend.hpp
 * @brief "spawn" mode: supervised child process in its own process group
 *
 * @date 2025
 */

#pragma once

#include "sandrun/backends/execution_backend.hpp"

namespace sandrun {
namespace backends {

/**
 * @class SpawnBackend
 * @brief Child process with captured output and timeout enforcement
 *
 * Always available. Also the fallback when the container runtime is not.
 */
class SpawnBackend : public ExecutionBackend {
public:
    core::ExecutionMode Mode() const override { return core::ExecutionMode::SPAWN; }

    core::RawTermination Run(const core::ExecutionRequest& request,
                             const core::ExecutionConfig& config) const override;
};

} // namespace backends
} // namespace sandrun
