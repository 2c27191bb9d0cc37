/**
 * @file string_utils.cpp
 * @brief Implementation of string helpers
 *
 * @date 2025
 */

#include "sandrun/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>

namespace sandrun {
namespace utils {

namespace {

constexpr const char* kWhitespace = " \t\n\r\f\v";

} // anonymous namespace

std::string StringUtils::Trim(const std::string& str) {
    const auto first = str.find_first_not_of(kWhitespace);
    if (first == std::string::npos) {
        return "";
    }
    const auto last = str.find_last_not_of(kWhitespace);
    return str.substr(first, last - first + 1);
}

std::string StringUtils::ToLower(const std::string& str) {
    std::string lowered;
    lowered.reserve(str.size());
    for (unsigned char c : str) {
        lowered.push_back(static_cast<char>(std::tolower(c)));
    }
    return lowered;
}

// Empty fields are dropped
std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter) {
    std::vector<std::string> fields;
    std::size_t begin = 0;
    while (begin <= str.size()) {
        std::size_t next = str.find(delimiter, begin);
        if (next == std::string::npos) {
            next = str.size();
        }
        if (next > begin) {
            fields.push_back(str.substr(begin, next - begin));
        }
        begin = next + 1;
    }
    return fields;
}

std::string StringUtils::Join(const std::vector<std::string>& strings,
                              const std::string& delimiter) {
    std::string joined;
    for (const auto& part : strings) {
        if (&part != &strings.front()) {
            joined += delimiter;
        }
        joined += part;
    }
    return joined;
}

std::string StringUtils::Truncate(const std::string& str, std::size_t max_length,
                                  const std::string& suffix) {
    if (str.size() <= max_length) {
        return str;
    }
    if (suffix.size() >= max_length) {
        return str.substr(0, max_length);
    }
    return str.substr(0, max_length - suffix.size()) + suffix;
}

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.rfind(prefix, 0) == 0;
}

// ============================================================================
// COMMAND LINES
// ============================================================================

std::string StringUtils::QuoteArgument(const std::string& arg) {
    if (arg.empty()) {
        return "''";
    }

    bool safe = std::all_of(arg.begin(), arg.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '_' || c == '.' ||
               c == '/' || c == '=' || c == ':' || c == ',' || c == '+' || c == '@';
    });
    if (safe) {
        return arg;
    }

    // Close the quote, emit an escaped quote, reopen
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string StringUtils::FormatCommandLine(const std::string& program,
                                           const std::vector<std::string>& args) {
    std::vector<std::string> parts;
    parts.reserve(args.size() + 1);
    parts.push_back(QuoteArgument(program));
    for (const auto& arg : args) {
        parts.push_back(QuoteArgument(arg));
    }
    return Join(parts, " ");
}

std::optional<std::pair<std::string, std::string>> StringUtils::ParseKeyValue(const std::string& entry) {
    auto pos = entry.find('=');
    if (pos == std::string::npos || pos == 0) {
        return std::nullopt;
    }
    return std::make_pair(entry.substr(0, pos), entry.substr(pos + 1));
}

} // namespace utils
} // namespace sandrun
