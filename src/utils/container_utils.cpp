/**
 * @file container_utils.cpp
 * @brief Implementation of container runtime helpers and the availability probe
 *
 * **Container lifecycle used by the executor**:
 * ```
 * run --name N ... ──► (client exits) ──► inspect N ──► rm -f N
 *          │
 *          └─ on timeout: kill --signal SIGTERM N ─(grace)─► kill --signal SIGKILL N
 * ```
 *
 * **Security Hardening** (always applied):
 * - --cap-drop ALL
 * - --security-opt no-new-privileges
 * - --network none unless networking is enabled
 * - memory, swap, CPU and process limits
 *
 * @date 2025
 */

#include "sandrun/utils/container_utils.hpp"
#include "sandrun/core/errors.hpp"
#include "sandrun/monitors/timeout_supervisor.hpp"
#include "sandrun/utils/string_utils.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <unistd.h>

#include <atomic>
#include <cstdint>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

using json = nlohmann::json;

namespace sandrun {
namespace utils {

namespace {

ContainerState ParseState(const std::string& state_str) {
    if (state_str == "created") return ContainerState::CREATED;
    if (state_str == "running") return ContainerState::RUNNING;
    if (state_str == "paused") return ContainerState::PAUSED;
    if (state_str == "restarting") return ContainerState::RUNNING;
    if (state_str == "exited") return ContainerState::EXITED;
    if (state_str == "dead") return ContainerState::DEAD;
    return ContainerState::UNKNOWN;
}

} // anonymous namespace

std::string ToString(ContainerState state) {
    switch (state) {
        case ContainerState::CREATED: return "created";
        case ContainerState::RUNNING: return "running";
        case ContainerState::PAUSED: return "paused";
        case ContainerState::EXITED: return "exited";
        case ContainerState::DEAD: return "dead";
        case ContainerState::UNKNOWN: break;
    }
    return "unknown";
}

// ============================================================================
// CONSTRUCTOR
// ============================================================================

ContainerUtils::ContainerUtils(std::string runtime)
    : runtime_(std::move(runtime)) {
}

// ============================================================================
// RUNTIME DETECTION
// ============================================================================
// The client alone is not enough: `version` with a server field fails when
// the daemon is down or the socket is not accessible

bool ContainerUtils::IsRuntimeAvailable(std::chrono::milliseconds timeout) const {
    return GetRuntimeVersion(timeout).has_value();
}

std::optional<std::string> ContainerUtils::GetRuntimeVersion(std::chrono::milliseconds timeout) const {
    auto result = ExecuteRuntimeCommand({"version", "--format", "{{.Server.Version}}"}, timeout);
    if (!result.Succeeded()) {
        spdlog::debug("Runtime '{}' not available (exit {}): {}", runtime_, result.exit_code,
                      StringUtils::Trim(result.error));
        return std::nullopt;
    }

    std::string version = StringUtils::Trim(result.output);
    if (version.empty()) {
        return std::nullopt;
    }
    return version;
}

// ============================================================================
// CONTAINER LIFECYCLE
// ============================================================================

bool ContainerUtils::KillContainer(const std::string& name, const std::string& signal) const {
    auto result = ExecuteRuntimeCommand({"kill", "--signal", signal, name});
    if (!result.Succeeded()) {
        // Usually the container already stopped
        spdlog::debug("kill {} {} failed: {}", signal, name, StringUtils::Trim(result.error));
        return false;
    }
    return true;
}

bool ContainerUtils::RemoveContainer(const std::string& name, bool force) const {
    std::vector<std::string> args = {"rm"};
    if (force) {
        args.push_back("-f");
    }
    args.push_back(name);

    auto result = ExecuteRuntimeCommand(args);
    if (!result.Succeeded()) {
        spdlog::warn("Failed to remove container {}: {}", name, StringUtils::Trim(result.error));
        return false;
    }

    spdlog::debug("Removed container {}", name);
    return true;
}

std::optional<ContainerInfo> ContainerUtils::InspectContainer(const std::string& name) const {
    auto result = ExecuteRuntimeCommand({"inspect", name});
    if (!result.Succeeded()) {
        spdlog::debug("inspect {} failed: {}", name, StringUtils::Trim(result.error));
        return std::nullopt;
    }

    try {
        return ParseInspectOutput(result.output);
    } catch (const json::exception& e) {
        spdlog::warn("Failed to parse inspect output for {}: {}", name, e.what());
        return std::nullopt;
    }
}

// ============================================================================
// COMMAND CONSTRUCTION
// ============================================================================

std::vector<std::string> ContainerUtils::BuildRunCommand(const ContainerRunSpec& spec) {
    const auto& settings = spec.settings;
    std::vector<std::string> args;

    args.push_back("run");

    // Container name
    args.push_back("--name");
    args.push_back(spec.name);

    // Memory limit, swap equal to memory means no swap
    args.push_back("--memory");
    args.push_back(std::to_string(settings.memory_limit_mb) + "m");
    args.push_back("--memory-swap");
    args.push_back(std::to_string(settings.memory_limit_mb) + "m");

    // CPU quota as a share of one CPU over the default 100ms period
    args.push_back("--cpu-period");
    args.push_back("100000");
    args.push_back("--cpu-quota");
    args.push_back(std::to_string(settings.cpu_quota_percent * 1000));

    // Process limit
    args.push_back("--pids-limit");
    args.push_back(std::to_string(settings.pids_limit));

    // Network mode
    args.push_back("--network");
    args.push_back(settings.network_enabled ? "bridge" : "none");

    // Security
    args.push_back("--cap-drop");
    args.push_back("ALL");
    args.push_back("--security-opt");
    args.push_back("no-new-privileges");

    if (settings.read_only_root) {
        args.push_back("--read-only");
    }

    // Working directory mount
    args.push_back("-v");
    args.push_back(spec.host_directory.string() + ":" + settings.mount_point +
                   (settings.read_only_root ? ":ro" : ":rw"));
    args.push_back("-w");
    args.push_back(settings.mount_point);

    // Environment variables
    for (const auto& [key, value] : spec.environment) {
        args.push_back("-e");
        args.push_back(key + "=" + value);
    }

    // Image, then the command verbatim
    args.push_back(settings.image);
    args.push_back(spec.program);
    args.insert(args.end(), spec.args.begin(), spec.args.end());

    return args;
}

ContainerInfo ContainerUtils::ParseInspectOutput(const std::string& json_str) {
    json j = json::parse(json_str);

    // inspect returns array with single object
    if (j.is_array()) {
        j = j.at(0);
    }

    ContainerInfo info;
    info.id = j.value("Id", "");
    info.name = j.value("Name", "");
    if (StringUtils::StartsWith(info.name, "/")) {
        info.name.erase(0, 1);
    }

    if (j.contains("State") && j["State"].is_object()) {
        const auto& state = j["State"];
        info.state = ParseState(state.value("Status", ""));
        info.exit_code = state.value("ExitCode", 0);
        info.oom_killed = state.value("OOMKilled", false);
    }

    return info;
}

std::string ContainerUtils::GenerateContainerName(const std::string& prefix) {
    static std::atomic<unsigned long> counter{0};
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<std::uint32_t> dis;

    std::ostringstream oss;
    oss << prefix << "-" << getpid() << "-" << counter++ << "-"
        << std::hex << std::setw(8) << std::setfill('0') << dis(gen);
    return oss.str();
}

// ============================================================================
// RUNTIME CLI EXECUTION
// ============================================================================

RuntimeCommandResult ContainerUtils::ExecuteRuntimeCommand(const std::vector<std::string>& args,
                                                           std::chrono::milliseconds timeout) const {
    monitors::LaunchOptions launch;
    launch.program = runtime_;
    launch.args = args;

    monitors::SupervisionOptions supervision;
    supervision.timeout = timeout;

    spdlog::debug("Runtime command: {}", StringUtils::FormatCommandLine(runtime_, args));

    RuntimeCommandResult result;
    try {
        auto run = monitors::RunSupervised(launch, supervision);
        result.output = std::move(run.output.out.data);
        result.error = std::move(run.output.err.data);
        result.timed_out = run.timed_out;
        result.exit_code = run.status.exited ? run.status.exit_code : core::kKilledExitCode;
    } catch (const core::EnvironmentError& e) {
        // Binary missing or not executable: the runtime is simply not there
        result.exit_code = 127;
        result.error = e.what();
    }

    return result;
}

// ============================================================================
// AVAILABILITY PROBE
// ============================================================================

ContainerRuntimeProbe::ContainerRuntimeProbe(std::chrono::milliseconds ttl, Checker checker)
    : ttl_(ttl),
      checker_(std::move(checker)) {
    if (!checker_) {
        checker_ = [](const std::string& runtime) {
            return ContainerUtils(runtime).IsRuntimeAvailable();
        };
    }
}

bool ContainerRuntimeProbe::IsAvailable(const std::string& runtime) {
    const auto now = std::chrono::steady_clock::now();
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = cache_.find(runtime);
        if (it != cache_.end() && now - it->second.checked_at < ttl_) {
            return it->second.available;
        }
    }

    // The check runs without the lock; concurrent misses may both probe
    bool available = false;
    try {
        available = checker_(runtime);
    } catch (const std::exception& e) {
        spdlog::warn("Container runtime probe for '{}' failed: {}", runtime, e.what());
    }

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        cache_[runtime] = Entry{available, std::chrono::steady_clock::now()};
    }

    spdlog::debug("Container runtime '{}' available: {}", runtime, available);
    return available;
}

void ContainerRuntimeProbe::Invalidate() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    cache_.clear();
}

void ContainerRuntimeProbe::Invalidate(const std::string& runtime) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    cache_.erase(runtime);
}

} // namespace utils
} // namespace sandrun
