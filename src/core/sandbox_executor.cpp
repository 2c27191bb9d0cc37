/**
 * @file sandbox_executor.cpp
 * @brief Implementation of the execution façade
 *
 * **Execution Workflow**:
 * 1. **Validation**: reject malformed requests before any process exists
 * 2. **Mode Resolution**: container requests probe the runtime, falling
 *    back to spawn when it does not answer
 * 3. **Execution**: the selected backend runs the command
 * 4. **Normalization**: one result shape for every backend
 *
 * @date 2025
 */

#include "sandrun/core/sandbox_executor.hpp"
#include "sandrun/core/result_normalizer.hpp"
#include "sandrun/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <system_error>

namespace sandrun {
namespace core {

namespace {

struct Interpreter {
    const char* program;
    const char* inline_flag;
    const char* image;
};

Interpreter InterpreterFor(CodeLanguage language) {
    switch (language) {
        case CodeLanguage::PYTHON:
            return {"python3", "-c", "python:3.13-alpine"};
        case CodeLanguage::NODE:
            return {"node", "-e", "node:20-alpine"};
        case CodeLanguage::BASH:
            return {"sh", "-c", "alpine:latest"};
    }
    throw ConfigurationError("Unsupported language");
}

} // anonymous namespace

// Constructor
SandboxExecutor::SandboxExecutor(std::shared_ptr<utils::ContainerRuntimeProbe> probe)
    : probe_(probe ? std::move(probe) : std::make_shared<utils::ContainerRuntimeProbe>()),
      container_backend_(probe_) {
    spdlog::debug("Sandbox executor initialized (probe TTL {} ms)", probe_->Ttl().count());
}

// ============================================================================
// VALIDATION
// ============================================================================

void SandboxExecutor::Validate(const ExecutionRequest& request, const ExecutionConfig& config) {
    if (utils::StringUtils::Trim(request.program).empty()) {
        throw ConfigurationError("Program name must not be empty");
    }

    if (config.timeout && config.timeout->count() <= 0) {
        throw ConfigurationError("Timeout must be positive, got " +
                                 std::to_string(config.timeout->count()) + " ms");
    }

    if (config.max_output_bytes && *config.max_output_bytes == 0) {
        throw ConfigurationError("Output cap must be positive");
    }

    if (config.working_directory) {
        std::error_code ec;
        if (!std::filesystem::is_directory(*config.working_directory, ec)) {
            throw ConfigurationError("Working directory does not exist: " +
                                     config.working_directory->string());
        }
    }

    if (config.mode == ExecutionMode::CONTAINER) {
        const auto& container = config.container;
        if (container.runtime.empty() || container.image.empty()) {
            throw ConfigurationError("Container runtime and image must not be empty");
        }
        if (container.memory_limit_mb == 0 || container.cpu_quota_percent <= 0 ||
            container.pids_limit <= 0) {
            throw ConfigurationError("Container limits must be positive");
        }
        if (!utils::StringUtils::StartsWith(container.mount_point, "/")) {
            throw ConfigurationError("Container mount point must be absolute: " +
                                     container.mount_point);
        }
    }
}

// ============================================================================
// MODE RESOLUTION
// ============================================================================

ModeResolution SandboxExecutor::ResolveMode(const ExecutionConfig& config) const {
    ModeResolution resolution;
    resolution.requested = config.mode;
    resolution.resolved = config.mode;

    if (config.mode == ExecutionMode::CONTAINER &&
        !container_backend_.IsAvailable(config.container)) {
        spdlog::warn("Container runtime '{}' not available, falling back to spawn",
                     config.container.runtime);
        resolution.resolved = ExecutionMode::SPAWN;
        resolution.fell_back = true;
    }

    return resolution;
}

bool SandboxExecutor::IsContainerRuntimeAvailable(const std::string& runtime) const {
    return probe_->IsAvailable(runtime);
}

const backends::ExecutionBackend& SandboxExecutor::BackendFor(ExecutionMode mode) const {
    switch (mode) {
        case ExecutionMode::NONE:
            return direct_backend_;
        case ExecutionMode::SPAWN:
            return spawn_backend_;
        case ExecutionMode::CONTAINER:
            return container_backend_;
    }
    return spawn_backend_;
}

// ============================================================================
// EXECUTION
// ============================================================================

ExecutionResult SandboxExecutor::Execute(const ExecutionRequest& request,
                                         const ExecutionConfig& config) const {
    Validate(request, config);
    return Run(request, config, ResolveMode(config));
}

ExecutionResult SandboxExecutor::ExecuteCode(const std::string& code, CodeLanguage language,
                                             const ExecutionConfig& config) const {
    const Interpreter interpreter = InterpreterFor(language);

    ExecutionRequest request;
    request.program = interpreter.program;
    request.args = {interpreter.inline_flag, code};

    ExecutionConfig effective = config;
    effective.container.image = interpreter.image;

    spdlog::debug("Executing {} snippet: {}", ToString(language),
                  utils::StringUtils::Truncate(code, 60));

    Validate(request, effective);
    return Run(request, effective, ResolveMode(effective));
}

ExecutionResult SandboxExecutor::Run(const ExecutionRequest& request, const ExecutionConfig& config,
                                     const ModeResolution& resolution) const {
    const auto& backend = BackendFor(resolution.resolved);

    spdlog::debug("Executing '{}' with backend {}", request.program, ToString(backend.Mode()));

    ExecutionResult result = NormalizeResult(backend.Run(request, config));
    result.requested_mode = resolution.requested;
    result.fell_back = resolution.fell_back;

    if (result.timed_out) {
        spdlog::warn("'{}' killed after timeout of {} ms", request.program,
                     config.timeout ? config.timeout->count() : 0);
    } else if (result.term_signal != 0) {
        spdlog::warn("'{}' killed by signal {}", request.program, result.term_signal);
    }
    if (result.stdout_truncated || result.stderr_truncated) {
        spdlog::warn("Output of '{}' truncated to {} bytes per stream", request.program,
                     config.max_output_bytes.value_or(0));
    }

    spdlog::debug("'{}' finished: exit {} in {} ms", request.program, result.exit_code,
                  result.duration.count());
    return result;
}

// ============================================================================
// CANCELLATION
// ============================================================================

monitors::TerminationReport SandboxExecutor::TerminateProcessTree(pid_t pid,
                                                                  std::chrono::milliseconds grace) {
    if (grace.count() < 0) {
        throw ConfigurationError("Grace period must not be negative");
    }
    spdlog::info("Terminating process tree {}", pid);
    return monitors::TerminateProcessTree(pid, grace);
}

} // namespace core
} // namespace sandrun
