/**
 * @file config_loader.hpp
 * @brief Layered ExecutionConfig loading
 *
 * Layers, later ones win:
 * 1. Built-in defaults
 * 2. JSON config file
 * 3. SANDRUN_* environment variables
 * 4. Command-line flags (applied by the caller)
 *
 * **Config file example**:
 * @code{.json}
 * {
 *   "mode": "container",
 *   "timeout_ms": 10000,
 *   "working_directory": "/srv/project",
 *   "max_output_bytes": 1048576,
 *   "environment": { "LANG": "C" },
 *   "container": { "image": "python:3.13-alpine", "memory_limit_mb": 512 }
 * }
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include "sandrun/core/execution_types.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace sandrun {
namespace utils {

/// Default deadline applied by the loader (not by ExecutionConfig itself).
constexpr std::chrono::milliseconds kDefaultTimeout{30000};

/**
 * @class ConfigLoader
 * @brief Builds ExecutionConfig from defaults, files and the environment
 *
 * Every malformed value is reported as core::ConfigurationError naming the
 * offending key.
 */
class ConfigLoader {
public:
    /// Looks up one environment variable.
    using EnvironmentLookup = std::function<std::optional<std::string>(const std::string&)>;

    /**
     * @brief Built-in defaults
     *
     * spawn mode, 30 s timeout, container defaults of ContainerSettings.
     */
    static core::ExecutionConfig Defaults();

    /**
     * @brief Apply a JSON config file on top of base
     * @throws core::ConfigurationError if the file is unreadable or invalid
     */
    static core::ExecutionConfig LoadFile(const std::filesystem::path& path,
                                          const core::ExecutionConfig& base = Defaults());

    /**
     * @brief Apply a JSON document on top of base
     *
     * Keys that are absent keep the base value. `"timeout_ms": null`
     * removes the deadline. Unknown keys are ignored.
     *
     * @throws core::ConfigurationError on malformed JSON or wrong types
     */
    static core::ExecutionConfig FromJsonString(const std::string& text,
                                                const core::ExecutionConfig& base = Defaults());

    /**
     * @brief Apply SANDRUN_MODE, SANDRUN_TIMEOUT_MS, SANDRUN_WORKDIR,
     *        SANDRUN_CONTAINER_RUNTIME and SANDRUN_CONTAINER_IMAGE
     *
     * SANDRUN_TIMEOUT_MS must be positive; leave it unset to keep the
     * deadline from the base config.
     *
     * @throws core::ConfigurationError on unparsable values
     */
    static core::ExecutionConfig ApplyEnvironment(const core::ExecutionConfig& base,
                                                  const EnvironmentLookup& lookup = SystemEnvironment);

    /// Reads the process environment.
    static std::optional<std::string> SystemEnvironment(const std::string& name);
};

} // namespace utils
} // namespace sandrun
