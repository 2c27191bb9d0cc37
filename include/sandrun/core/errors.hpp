/**
 * @file errors.hpp
 * @brief Error taxonomy of the sandboxed execution layer
 *
 * Only two conditions are raised as exceptions. Everything else (non-zero
 * exit, timeout, backend fallback) is reported inside ExecutionResult.
 *
 * @date 2025
 */

#pragma once

#include <stdexcept>
#include <string>
#include <system_error>

namespace sandrun {
namespace core {

/**
 * @class ConfigurationError
 * @brief Malformed ExecutionConfig or ExecutionRequest
 *
 * Raised before any process is spawned: empty program name, non-positive
 * timeout, non-positive output cap, missing working directory, unknown mode
 * name. Never retried.
 */
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& message)
        : std::invalid_argument(message) {}
};

/**
 * @class EnvironmentError
 * @brief The OS primitive needed to start the process is unavailable
 *
 * Carries the errno of the failing call (ENOENT for a missing executable,
 * EACCES for a non-executable one, EAGAIN from fork, ...).
 */
class EnvironmentError : public std::system_error {
public:
    EnvironmentError(int error_number, const std::string& message)
        : std::system_error(error_number, std::system_category(), message) {}
};

} // namespace core
} // namespace sandrun
