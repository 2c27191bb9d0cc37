/**
 * @file execution_backend.cpp
 * @brief Shared helpers for local backends
 *
 * @date 2025
 */

#include "sandrun/backends/execution_backend.hpp"

namespace sandrun {
namespace backends {

monitors::LaunchOptions ExecutionBackend::MakeLaunchOptions(const core::ExecutionRequest& request,
                                                            const core::ExecutionConfig& config,
                                                            bool new_process_group) {
    monitors::LaunchOptions options;
    options.program = request.program;
    options.args = request.args;
    options.working_directory = config.working_directory;
    options.environment = config.environment;
    options.new_process_group = new_process_group;
    return options;
}

} // namespace backends
} // namespace sandrun
