/**
 * @file execution_types.cpp
 * @brief Name conversions for execution modes and code languages
 *
 * @date 2025
 */

#include "sandrun/core/execution_types.hpp"
#include "sandrun/core/errors.hpp"
#include "sandrun/utils/string_utils.hpp"

namespace sandrun {
namespace core {

std::string ToString(ExecutionMode mode) {
    switch (mode) {
        case ExecutionMode::NONE:
            return "none";
        case ExecutionMode::SPAWN:
            return "spawn";
        case ExecutionMode::CONTAINER:
            return "container";
    }
    return "unknown";
}

ExecutionMode ParseExecutionMode(const std::string& name) {
    const std::string normalized = utils::StringUtils::ToLower(utils::StringUtils::Trim(name));

    if (normalized == "none") {
        return ExecutionMode::NONE;
    }
    if (normalized == "spawn") {
        return ExecutionMode::SPAWN;
    }
    // "docker" is kept as an alias of the container backend
    if (normalized == "container" || normalized == "docker") {
        return ExecutionMode::CONTAINER;
    }

    throw ConfigurationError("Unknown execution mode: '" + name +
                             "' (expected none, spawn or container)");
}

std::string ToString(CodeLanguage language) {
    switch (language) {
        case CodeLanguage::PYTHON:
            return "python";
        case CodeLanguage::NODE:
            return "node";
        case CodeLanguage::BASH:
            return "bash";
    }
    return "unknown";
}

CodeLanguage ParseCodeLanguage(const std::string& name) {
    const std::string normalized = utils::StringUtils::ToLower(utils::StringUtils::Trim(name));

    if (normalized == "python" || normalized == "python3") {
        return CodeLanguage::PYTHON;
    }
    if (normalized == "node" || normalized == "javascript") {
        return CodeLanguage::NODE;
    }
    if (normalized == "bash" || normalized == "sh") {
        return CodeLanguage::BASH;
    }

    throw ConfigurationError("Unsupported language: '" + name + "'");
}

} // namespace core
} // namespace sandrun
