/**
 * @file main.cpp
 * @brief sandrun - Command-line interface
 *
 * Runs one command through the sandboxed executor and replays its output.
 * The child's stdout goes to stdout and its stderr to stderr; sandrun's own
 * log lines also go to stderr.
 *
 * **Exit status**:
 * - child's exit code when it exited
 * - 124 when killed after timeout
 * - 128 + signal when killed by a signal
 * - 2 for configuration errors, 127 when the program cannot be started
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "sandrun/core/sandbox_executor.hpp"
#include "sandrun/reporters/result_reporter.hpp"
#include "sandrun/utils/config_loader.hpp"
#include "sandrun/utils/container_utils.hpp"
#include "sandrun/utils/string_utils.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {

constexpr int kExitTimeout = 124;
constexpr int kExitSignalBase = 128;
constexpr int kExitConfigurationError = 2;
constexpr int kExitEnvironmentError = 127;

/*******************************************************************************
 * Exit Status
 ******************************************************************************/

int ExitStatusFor(const sandrun::core::ExecutionResult& result) {
    if (result.timed_out) {
        return kExitTimeout;
    }
    if (result.term_signal != 0) {
        return kExitSignalBase + result.term_signal;
    }
    return result.exit_code;
}

int ProbeRuntime(const std::string& runtime) {
    sandrun::utils::ContainerUtils utils(runtime);
    auto version = utils.GetRuntimeVersion();
    if (version) {
        std::cout << runtime << ": available (server " << *version << ")" << std::endl;
        return 0;
    }
    std::cout << runtime << ": unavailable" << std::endl;
    return 1;
}

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    // Configure CLI parser
    CLI::App app{"sandrun - run a command in a sandbox with a deadline"};
    app.prefix_command();
    app.footer("\nEverything after the first positional argument is passed to the program verbatim.");

    std::string mode_name;
    long long timeout_ms = 0;
    bool no_timeout = false;
    std::string working_directory;
    std::string config_file;
    std::vector<std::string> env_entries;
    std::string image;
    std::string runtime;
    std::size_t memory_mb = 0;
    bool network = false;
    bool read_only = false;
    std::size_t max_output_bytes = 0;
    bool json_output = false;
    bool probe = false;
    bool verbose = false;
    bool quiet = false;
    std::string code_language;

    auto* mode_opt = app.add_option("-m,--mode", mode_name, "Execution mode: none, spawn, container");
    auto* timeout_opt = app.add_option("-t,--timeout-ms", timeout_ms, "Deadline in milliseconds");
    app.add_flag("--no-timeout", no_timeout, "Run without a deadline");
    auto* cwd_opt = app.add_option("-C,--cwd", working_directory, "Working directory")
        ->check(CLI::ExistingDirectory);
    app.add_option("-c,--config", config_file, "JSON config file")
        ->check(CLI::ExistingFile);
    app.add_option("-e,--env", env_entries, "Environment variable KEY=VALUE (repeatable)");
    auto* image_opt = app.add_option("--image", image, "Container image");
    auto* runtime_opt = app.add_option("--runtime", runtime, "Container runtime binary");
    auto* memory_opt = app.add_option("--memory-mb", memory_mb, "Container memory limit in MB")
        ->check(CLI::PositiveNumber);
    app.add_flag("--network", network, "Enable container networking");
    app.add_flag("--read-only", read_only, "Read-only container root and workspace");
    auto* cap_opt = app.add_option("--max-output-bytes", max_output_bytes, "Per-stream capture cap")
        ->check(CLI::PositiveNumber);
    app.add_flag("--json", json_output, "Print the result as JSON on stdout");
    app.add_flag("--probe", probe, "Report container runtime availability and exit");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_flag("-q,--quiet", quiet, "Only log warnings and errors");
    auto* code_opt = app.add_option("--code", code_language,
                                    "Treat the argument as a snippet in LANG (python, node, bash)");

    CLI11_PARSE(app, argc, argv);

    // Configure logging level and format; logs never mix with the child's stdout
    spdlog::set_default_logger(spdlog::stderr_color_mt("sandrun"));
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
        spdlog::debug("Verbose logging enabled");
    } else if (quiet) {
        spdlog::set_level(spdlog::level::warn);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    try {
        using sandrun::utils::ConfigLoader;

        // Defaults, then file, then environment, then flags
        auto config = ConfigLoader::Defaults();
        if (!config_file.empty()) {
            config = ConfigLoader::LoadFile(config_file, config);
        }
        config = ConfigLoader::ApplyEnvironment(config);

        if (*mode_opt) {
            config.mode = sandrun::core::ParseExecutionMode(mode_name);
        }
        if (*timeout_opt) {
            config.timeout = std::chrono::milliseconds(timeout_ms);
        }
        if (no_timeout) {
            config.timeout.reset();
        }
        if (*cwd_opt) {
            config.working_directory = working_directory;
        }
        for (const auto& entry : env_entries) {
            auto kv = sandrun::utils::StringUtils::ParseKeyValue(entry);
            if (!kv) {
                throw sandrun::core::ConfigurationError("Invalid --env entry '" + entry +
                                                        "', expected KEY=VALUE");
            }
            config.environment[kv->first] = kv->second;
        }
        if (*image_opt) {
            config.container.image = image;
        }
        if (*runtime_opt) {
            config.container.runtime = runtime;
        }
        if (*memory_opt) {
            config.container.memory_limit_mb = memory_mb;
        }
        if (network) {
            config.container.network_enabled = true;
        }
        if (read_only) {
            config.container.read_only_root = true;
        }
        if (*cap_opt) {
            config.max_output_bytes = max_output_bytes;
        }

        if (probe) {
            return ProbeRuntime(config.container.runtime);
        }

        std::vector<std::string> command = app.remaining();
        if (!command.empty() && command.front() == "--") {
            command.erase(command.begin());
        }
        if (command.empty()) {
            throw sandrun::core::ConfigurationError("No program given");
        }

        sandrun::core::SandboxExecutor executor;
        sandrun::core::ExecutionResult result;

        if (*code_opt) {
            if (command.size() != 1) {
                throw sandrun::core::ConfigurationError("--code takes exactly one snippet argument");
            }
            result = executor.ExecuteCode(command.front(),
                                          sandrun::core::ParseCodeLanguage(code_language), config);
        } else {
            sandrun::core::ExecutionRequest request;
            request.program = command.front();
            request.args.assign(command.begin() + 1, command.end());
            result = executor.Execute(request, config);
        }

        // Output
        if (json_output) {
            sandrun::reporters::ResultReporter reporter;
            std::cout << reporter.GenerateJsonString(result) << std::endl;
        } else {
            std::cout << result.stdout_output << std::flush;
            std::cerr << result.stderr_output << std::flush;
        }

        const std::string summary = sandrun::reporters::ResultReporter::Describe(result);
        if (result.Succeeded()) {
            spdlog::debug("{}", summary);
        } else {
            spdlog::info("{}", summary);
        }

        return ExitStatusFor(result);

    } catch (const sandrun::core::ConfigurationError& e) {
        spdlog::error("Configuration error: {}", e.what());
        return kExitConfigurationError;
    } catch (const sandrun::core::EnvironmentError& e) {
        spdlog::error("Cannot start program: {}", e.what());
        return kExitEnvironmentError;
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Filesystem error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
