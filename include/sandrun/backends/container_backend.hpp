/**
 * @file container_backend.hpp
 * @brief "container" mode: run inside a Docker-compatible runtime
 *
 * The runtime CLI is the supervised child. The command runs in a fresh
 * container with the working directory mounted at the configured mount
 * point, resource limits applied and all capabilities dropped.
 *
 * @date 2025
 */

#pragma once

#include "sandrun/backends/execution_backend.hpp"
#include "sandrun/utils/container_utils.hpp"

#include <memory>

namespace sandrun {
namespace backends {

/**
 * @class ContainerBackend
 * @brief Executes through `<runtime> run` and cleans the container up
 */
class ContainerBackend : public ExecutionBackend {
public:
    explicit ContainerBackend(std::shared_ptr<utils::ContainerRuntimeProbe> probe);

    core::ExecutionMode Mode() const override { return core::ExecutionMode::CONTAINER; }

    /**
     * @brief Ask the probe whether the configured runtime answers
     * @note Cached, never throws
     */
    bool IsAvailable(const core::ContainerSettings& settings) const;

    core::RawTermination Run(const core::ExecutionRequest& request,
                             const core::ExecutionConfig& config) const override;

private:
    std::shared_ptr<utils::ContainerRuntimeProbe> probe_;
};

} // namespace backends
} // namespace sandrun
