/**
 * @file config_loader.cpp
 * @brief Implementation of layered configuration loading
 *
 * @date 2025
 */

#include "sandrun/utils/config_loader.hpp"
#include "sandrun/core/errors.hpp"
#include "sandrun/utils/string_utils.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>

using json = nlohmann::json;

namespace sandrun {
namespace utils {

namespace {

const std::set<std::string> kTopLevelKeys = {
    "mode", "timeout_ms", "working_directory", "max_output_bytes", "environment", "container"
};

const std::set<std::string> kContainerKeys = {
    "runtime", "image", "memory_limit_mb", "cpu_quota_percent", "pids_limit",
    "network_enabled", "read_only_root", "mount_point"
};

long long PositiveInteger(const json& value, const std::string& key) {
    if (!value.is_number_integer()) {
        throw core::ConfigurationError("'" + key + "' must be an integer");
    }
    long long number = value.get<long long>();
    if (number <= 0) {
        throw core::ConfigurationError("'" + key + "' must be positive, got " + std::to_string(number));
    }
    return number;
}

std::string String(const json& value, const std::string& key) {
    if (!value.is_string()) {
        throw core::ConfigurationError("'" + key + "' must be a string");
    }
    return value.get<std::string>();
}

bool Boolean(const json& value, const std::string& key) {
    if (!value.is_boolean()) {
        throw core::ConfigurationError("'" + key + "' must be a boolean");
    }
    return value.get<bool>();
}

long long ParseInteger(const std::string& text, const std::string& name) {
    const std::string trimmed = StringUtils::Trim(text);
    std::size_t consumed = 0;
    long long value = 0;
    try {
        value = std::stoll(trimmed, &consumed);
    } catch (const std::logic_error&) {
        throw core::ConfigurationError(name + " is not a number: '" + text + "'");
    }
    if (consumed != trimmed.size()) {
        throw core::ConfigurationError(name + " is not a number: '" + text + "'");
    }
    return value;
}

void WarnUnknownKeys(const json& object, const std::set<std::string>& known, const std::string& where) {
    for (const auto& item : object.items()) {
        if (known.count(item.key()) == 0) {
            spdlog::debug("Ignoring unknown config key '{}{}'", where, item.key());
        }
    }
}

void ApplyContainer(const json& container, core::ContainerSettings& settings) {
    if (!container.is_object()) {
        throw core::ConfigurationError("'container' must be an object");
    }
    WarnUnknownKeys(container, kContainerKeys, "container.");

    if (container.contains("runtime")) {
        settings.runtime = String(container["runtime"], "container.runtime");
    }
    if (container.contains("image")) {
        settings.image = String(container["image"], "container.image");
    }
    if (container.contains("memory_limit_mb")) {
        settings.memory_limit_mb = static_cast<std::size_t>(
            PositiveInteger(container["memory_limit_mb"], "container.memory_limit_mb"));
    }
    if (container.contains("cpu_quota_percent")) {
        settings.cpu_quota_percent = static_cast<int>(
            PositiveInteger(container["cpu_quota_percent"], "container.cpu_quota_percent"));
    }
    if (container.contains("pids_limit")) {
        settings.pids_limit = static_cast<int>(
            PositiveInteger(container["pids_limit"], "container.pids_limit"));
    }
    if (container.contains("network_enabled")) {
        settings.network_enabled = Boolean(container["network_enabled"], "container.network_enabled");
    }
    if (container.contains("read_only_root")) {
        settings.read_only_root = Boolean(container["read_only_root"], "container.read_only_root");
    }
    if (container.contains("mount_point")) {
        settings.mount_point = String(container["mount_point"], "container.mount_point");
    }
}

} // anonymous namespace

// ============================================================================
// DEFAULTS
// ============================================================================

core::ExecutionConfig ConfigLoader::Defaults() {
    core::ExecutionConfig config;
    config.mode = core::ExecutionMode::SPAWN;
    config.timeout = kDefaultTimeout;
    return config;
}

// ============================================================================
// JSON
// ============================================================================

core::ExecutionConfig ConfigLoader::LoadFile(const std::filesystem::path& path,
                                             const core::ExecutionConfig& base) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw core::ConfigurationError("Cannot open config file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    spdlog::debug("Loading config file {}", path.string());
    return FromJsonString(buffer.str(), base);
}

core::ExecutionConfig ConfigLoader::FromJsonString(const std::string& text,
                                                   const core::ExecutionConfig& base) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw core::ConfigurationError(std::string("Malformed config JSON: ") + e.what());
    }

    if (!j.is_object()) {
        throw core::ConfigurationError("Config must be a JSON object");
    }
    WarnUnknownKeys(j, kTopLevelKeys, "");

    core::ExecutionConfig config = base;

    if (j.contains("mode")) {
        config.mode = core::ParseExecutionMode(String(j["mode"], "mode"));
    }

    if (j.contains("timeout_ms")) {
        if (j["timeout_ms"].is_null()) {
            config.timeout.reset();
        } else {
            config.timeout = std::chrono::milliseconds(PositiveInteger(j["timeout_ms"], "timeout_ms"));
        }
    }

    if (j.contains("working_directory")) {
        if (j["working_directory"].is_null()) {
            config.working_directory.reset();
        } else {
            config.working_directory = std::filesystem::path(String(j["working_directory"], "working_directory"));
        }
    }

    if (j.contains("max_output_bytes")) {
        if (j["max_output_bytes"].is_null()) {
            config.max_output_bytes.reset();
        } else {
            config.max_output_bytes = static_cast<std::size_t>(
                PositiveInteger(j["max_output_bytes"], "max_output_bytes"));
        }
    }

    if (j.contains("environment")) {
        const auto& environment = j["environment"];
        if (!environment.is_object()) {
            throw core::ConfigurationError("'environment' must be an object");
        }
        for (const auto& item : environment.items()) {
            config.environment[item.key()] = String(item.value(), "environment." + item.key());
        }
    }

    if (j.contains("container")) {
        ApplyContainer(j["container"], config.container);
    }

    return config;
}

// ============================================================================
// ENVIRONMENT
// ============================================================================

core::ExecutionConfig ConfigLoader::ApplyEnvironment(const core::ExecutionConfig& base,
                                                     const EnvironmentLookup& lookup) {
    core::ExecutionConfig config = base;

    if (auto mode = lookup("SANDRUN_MODE")) {
        config.mode = core::ParseExecutionMode(*mode);
    }

    if (auto timeout = lookup("SANDRUN_TIMEOUT_MS")) {
        long long value = ParseInteger(*timeout, "SANDRUN_TIMEOUT_MS");
        if (value <= 0) {
            throw core::ConfigurationError("SANDRUN_TIMEOUT_MS must be positive, got " + *timeout);
        }
        config.timeout = std::chrono::milliseconds(value);
    }

    if (auto workdir = lookup("SANDRUN_WORKDIR")) {
        config.working_directory = std::filesystem::path(*workdir);
    }

    if (auto runtime = lookup("SANDRUN_CONTAINER_RUNTIME")) {
        config.container.runtime = *runtime;
    }

    if (auto image = lookup("SANDRUN_CONTAINER_IMAGE")) {
        config.container.image = *image;
    }

    return config;
}

std::optional<std::string> ConfigLoader::SystemEnvironment(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

} // namespace utils
} // namespace sandrun
