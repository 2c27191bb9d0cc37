/**
 * @file container_backend.cpp
 * @brief Implementation of container execution
 *
 * **Execution Workflow**:
 * 1. Generate a unique container name
 * 2. `run` the command with limits, mount and environment
 * 3. On timeout: stop the container (SIGTERM, grace, SIGKILL), then the client
 * 4. `inspect` for the OOM flag
 * 5. `rm -f` the container
 *
 * @date 2025
 */

#include "sandrun/backends/container_backend.hpp"
#include "sandrun/monitors/timeout_supervisor.hpp"
#include "sandrun/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <thread>

namespace sandrun {
namespace backends {

ContainerBackend::ContainerBackend(std::shared_ptr<utils::ContainerRuntimeProbe> probe)
    : probe_(std::move(probe)) {
}

bool ContainerBackend::IsAvailable(const core::ContainerSettings& settings) const {
    return probe_ && probe_->IsAvailable(settings.runtime);
}

core::RawTermination ContainerBackend::Run(const core::ExecutionRequest& request,
                                           const core::ExecutionConfig& config) const {
    const auto& settings = config.container;
    const utils::ContainerUtils runtime(settings.runtime);

    utils::ContainerRunSpec spec;
    spec.settings = settings;
    spec.name = utils::ContainerUtils::GenerateContainerName();
    spec.host_directory = std::filesystem::absolute(
        config.working_directory ? *config.working_directory : std::filesystem::current_path());
    spec.environment = config.environment;
    spec.program = request.program;
    spec.args = request.args;

    // The runtime CLI runs on the host with the host environment; the
    // configured variables are passed into the container with -e
    monitors::LaunchOptions launch;
    launch.program = settings.runtime;
    launch.args = utils::ContainerUtils::BuildRunCommand(spec);

    spdlog::info("Running in container {} (image {})", spec.name, settings.image);
    spdlog::debug("container: {}", utils::StringUtils::FormatCommandLine(launch.program, launch.args));

    monitors::SupervisionOptions supervision;
    supervision.timeout = config.timeout;
    supervision.max_output_bytes = config.max_output_bytes;
    supervision.on_started = request.on_started;
    supervision.before_terminate = [&runtime, &spec, grace = supervision.grace]() {
        runtime.KillContainer(spec.name, "SIGTERM");
        std::this_thread::sleep_for(grace);
        runtime.KillContainer(spec.name, "SIGKILL");
    };

    auto run = monitors::RunSupervised(launch, supervision);

    core::RawTermination raw;
    raw.backend = Mode();
    raw.status = run.status;
    raw.timeout_fired = run.timed_out;
    raw.output = std::move(run.output);
    raw.duration = run.duration;

    if (auto info = runtime.InspectContainer(spec.name)) {
        spdlog::debug("Container {} ({}) is {}, exit code {}", info->name,
                      info->id.substr(0, 12), utils::ToString(info->state), info->exit_code);
        raw.oom_killed = info->oom_killed;
        if (raw.oom_killed) {
            spdlog::warn("Container {} was killed for exceeding {} MB (exit code {})", info->name,
                         settings.memory_limit_mb, info->exit_code);
        }
        if (info->state == utils::ContainerState::RUNNING) {
            spdlog::warn("Container {} outlived its client, removing it", info->name);
        }
    }
    runtime.RemoveContainer(spec.name);

    return raw;
}

} // namespace backends
} // namespace sandrun
