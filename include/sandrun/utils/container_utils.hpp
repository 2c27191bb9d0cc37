/**
 * @file container_utils.hpp
 * @brief Container runtime CLI helpers and the cached availability probe
 *
 * Talks to any Docker-compatible runtime CLI (docker, podman) by running it
 * as a supervised child process. Nothing here goes through a shell.
 *
 * @date 2025
 */

#pragma once

#include "sandrun/core/execution_types.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace sandrun {
namespace utils {

/// Deadline for a single runtime CLI call (version, inspect, kill, rm).
constexpr std::chrono::milliseconds kRuntimeCommandTimeout{5000};

/// How long a probe answer stays valid.
constexpr std::chrono::milliseconds kDefaultProbeTtl{5000};

/**
 * @enum ContainerState
 * @brief Container lifecycle states as reported by inspect
 */
enum class ContainerState {
    CREATED,   ///< Container created but not started
    RUNNING,   ///< Container is running
    PAUSED,    ///< Container paused
    EXITED,    ///< Container exited
    DEAD,      ///< Container is dead
    UNKNOWN    ///< Unknown state
};

/// Lower-case state name as the runtime spells it ("running", "exited", ...).
std::string ToString(ContainerState state);

/**
 * @struct ContainerInfo
 * @brief Subset of inspect output the executor cares about
 */
struct ContainerInfo {
    std::string id;                              ///< Container ID
    std::string name;                            ///< Container name (without leading '/')
    ContainerState state{ContainerState::UNKNOWN};
    int exit_code{0};                            ///< State.ExitCode
    bool oom_killed{false};                      ///< State.OOMKilled
};

/**
 * @struct ContainerRunSpec
 * @brief Everything needed to build a `run` command line
 */
struct ContainerRunSpec {
    core::ContainerSettings settings;
    std::string name;                              ///< --name, used later for inspect/kill/rm
    std::filesystem::path host_directory;          ///< Mounted at settings.mount_point
    std::map<std::string, std::string> environment;
    std::string program;
    std::vector<std::string> args;
};

/**
 * @struct RuntimeCommandResult
 * @brief Outcome of one runtime CLI call
 */
struct RuntimeCommandResult {
    int exit_code{-1};
    std::string output;
    std::string error;
    bool timed_out{false};

    bool Succeeded() const { return exit_code == 0 && !timed_out; }
};

/**
 * @class ContainerUtils
 * @brief Thin wrapper over one runtime binary
 *
 * **Usage**:
 * @code
 * ContainerUtils docker("docker");
 * if (docker.IsRuntimeAvailable()) {
 *     auto info = docker.InspectContainer("sandrun-1234-0-ab12cd34");
 * }
 * @endcode
 */
class ContainerUtils {
public:
    explicit ContainerUtils(std::string runtime = "docker");

    const std::string& Runtime() const { return runtime_; }

    /**
     * @brief Check that the CLI exists and its daemon answers
     *
     * Runs `<runtime> version --format {{.Server.Version}}`. Any failure
     * (missing binary, daemon down, permission denied, timeout) is reported
     * as false, never thrown.
     */
    bool IsRuntimeAvailable(std::chrono::milliseconds timeout = kRuntimeCommandTimeout) const;

    /**
     * @brief Server version string
     * @return Version, or std::nullopt when the runtime does not answer
     */
    std::optional<std::string> GetRuntimeVersion(std::chrono::milliseconds timeout = kRuntimeCommandTimeout) const;

    /**
     * @brief Send a signal to a running container
     * @param signal Signal name understood by the runtime ("SIGTERM", "SIGKILL")
     */
    bool KillContainer(const std::string& name, const std::string& signal = "SIGKILL") const;

    bool RemoveContainer(const std::string& name, bool force = true) const;

    /**
     * @brief Read state of a container
     * @return Info, or std::nullopt if the container does not exist or the
     *         output cannot be parsed
     */
    std::optional<ContainerInfo> InspectContainer(const std::string& name) const;

    /**
     * @brief Arguments following the runtime binary for a `run` invocation
     *
     * Always adds --cap-drop ALL and --security-opt no-new-privileges.
     * Never adds --rm, the caller inspects and removes the container itself.
     */
    static std::vector<std::string> BuildRunCommand(const ContainerRunSpec& spec);

    /**
     * @brief Parse `inspect` JSON (array with a single object, or the object)
     * @throws nlohmann::json::exception on malformed input
     */
    static ContainerInfo ParseInspectOutput(const std::string& json_str);

    /// Unique container name, "<prefix>-<pid>-<counter>-<random hex>".
    static std::string GenerateContainerName(const std::string& prefix = "sandrun");

private:
    RuntimeCommandResult ExecuteRuntimeCommand(const std::vector<std::string>& args,
                                               std::chrono::milliseconds timeout = kRuntimeCommandTimeout) const;

    std::string runtime_;
};

/**
 * @class ContainerRuntimeProbe
 * @brief Caches container runtime availability per runtime binary
 *
 * Answers are reused for the TTL, so a burst of container executions does
 * not spawn one `version` call each. Readers share the lock; a refresh
 * takes it exclusively and replaces the whole entry.
 */
class ContainerRuntimeProbe {
public:
    /// Performs the actual check for a runtime binary.
    using Checker = std::function<bool(const std::string& runtime)>;

    /**
     * @param ttl How long an answer stays valid
     * @param checker Check to run on a cache miss, defaults to
     *        ContainerUtils::IsRuntimeAvailable
     */
    explicit ContainerRuntimeProbe(std::chrono::milliseconds ttl = kDefaultProbeTtl,
                                   Checker checker = nullptr);

    /// Never throws.
    bool IsAvailable(const std::string& runtime);

    /// Drop every cached answer.
    void Invalidate();

    /// Drop the cached answer for one runtime.
    void Invalidate(const std::string& runtime);

    std::chrono::milliseconds Ttl() const { return ttl_; }

private:
    struct Entry {
        bool available{false};
        std::chrono::steady_clock::time_point checked_at;
    };

    const std::chrono::milliseconds ttl_;
    Checker checker_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, Entry> cache_;
};

} // namespace utils
} // namespace sandrun
