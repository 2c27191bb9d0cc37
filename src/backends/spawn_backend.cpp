/**
 * @file spawn_backend.cpp
 * @brief Implementation of supervised local execution
 *
 * @date 2025
 */

#include "sandrun/backends/spawn_backend.hpp"
#include "sandrun/monitors/timeout_supervisor.hpp"
#include "sandrun/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

namespace sandrun {
namespace backends {

core::RawTermination SpawnBackend::Run(const core::ExecutionRequest& request,
                                       const core::ExecutionConfig& config) const {
    spdlog::debug("spawn: {}", utils::StringUtils::FormatCommandLine(request.program, request.args));

    monitors::SupervisionOptions supervision;
    supervision.timeout = config.timeout;
    supervision.max_output_bytes = config.max_output_bytes;
    supervision.on_started = request.on_started;

    auto run = monitors::RunSupervised(MakeLaunchOptions(request, config, true), supervision);

    core::RawTermination raw;
    raw.backend = Mode();
    raw.status = run.status;
    raw.timeout_fired = run.timed_out;
    raw.output = std::move(run.output);
    raw.duration = run.duration;
    return raw;
}

} // namespace backends
} // namespace sandrun
