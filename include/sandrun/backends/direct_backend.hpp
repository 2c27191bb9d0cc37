/**
 * @file direct_backend.hpp
 * @brief "none" mode: run directly without supervision
 *
 * @date 2025
 */

#pragma once

#include "sandrun/backends/execution_backend.hpp"

namespace sandrun {
namespace backends {

/**
 * @class DirectBackend
 * @brief Executes with the caller's permissions and no timeout
 *
 * The child stays in the caller's process group and any configured
 * timeout is ignored. Only for trusted commands.
 */
class DirectBackend : public ExecutionBackend {
public:
    core::ExecutionMode Mode() const override { return core::ExecutionMode::NONE; }

    core::RawTermination Run(const core::ExecutionRequest& request,
                             const core::ExecutionConfig& config) const override;
};

} // namespace backends
} // namespace sandrun
