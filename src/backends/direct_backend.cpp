/**
 * @file direct_backend.cpp
 * @brief Implementation of unsupervised execution
 *
 * @date 2025
 */

#include "sandrun/backends/direct_backend.hpp"
#include "sandrun/monitors/timeout_supervisor.hpp"
#include "sandrun/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

namespace sandrun {
namespace backends {

core::RawTermination DirectBackend::Run(const core::ExecutionRequest& request,
                                        const core::ExecutionConfig& config) const {
    spdlog::warn("Running '{}' without sandbox or supervision (mode none)", request.program);
    if (config.timeout) {
        spdlog::warn("Timeout of {} ms ignored in mode none", config.timeout->count());
    }

    monitors::SupervisionOptions supervision;
    supervision.max_output_bytes = config.max_output_bytes;
    supervision.on_started = request.on_started;

    auto run = monitors::RunSupervised(MakeLaunchOptions(request, config, false), supervision);

    core::RawTermination raw;
    raw.backend = Mode();
    raw.status = run.status;
    raw.output = std::move(run.output);
    raw.duration = run.duration;
    return raw;
}

} // namespace backends
} // namespace sandrun
