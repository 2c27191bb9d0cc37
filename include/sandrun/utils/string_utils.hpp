/**
 * @file string_utils.hpp
 * @brief String helpers for command lines, environment entries and logs
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sandrun {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string manipulation helpers
 *
 * All methods are static - no instantiation required.
 */
class StringUtils {
public:
    /***************************************************************************
     * String Manipulation
     ***************************************************************************/

    /**
     * @brief Trim whitespace from both ends of string
     * @param str Input string
     * @return Trimmed string
     */
    static std::string Trim(const std::string& str);

    /**
     * @brief Convert string to lowercase
     * @param str Input string
     * @return Lowercase string
     */
    static std::string ToLower(const std::string& str);

    /**
     * @brief Split string by delimiter
     *
     * Empty tokens are skipped, so "a::b" yields ["a", "b"].
     *
     * @param str Input string
     * @param delimiter Character to split on
     * @return Vector of non-empty substrings
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    /**
     * @brief Join strings with delimiter
     *
     * @code
     * auto line = StringUtils::Join({"ls", "-la"}, " ");  // "ls -la"
     * @endcode
     */
    static std::string Join(const std::vector<std::string>& strings, const std::string& delimiter);

    /**
     * @brief Shorten a string for log output
     *
     * @param str Input string
     * @param max_length Maximum length including the suffix
     * @param suffix Appended when the string is cut
     */
    static std::string Truncate(const std::string& str, std::size_t max_length,
                                const std::string& suffix = "...");

    /***************************************************************************
     * String Checking
     ***************************************************************************/

    static bool StartsWith(const std::string& str, const std::string& prefix);

    /***************************************************************************
     * Command Lines
     ***************************************************************************/

    /**
     * @brief Quote one argument the way a POSIX shell would need it
     *
     * Arguments made only of safe characters are returned unchanged.
     * Everything else is wrapped in single quotes. Used for display only,
     * commands are never run through a shell.
     */
    static std::string QuoteArgument(const std::string& arg);

    /**
     * @brief Render program and arguments as a single readable line
     */
    static std::string FormatCommandLine(const std::string& program,
                                         const std::vector<std::string>& args);

    /**
     * @brief Split a KEY=VALUE entry
     *
     * The value may contain further '=' characters and may be empty.
     *
     * @return Key and value, or std::nullopt when there is no '=' or the key is empty
     */
    static std::optional<std::pair<std::string, std::string>> ParseKeyValue(const std::string& entry);
};

} // namespace utils
} // namespace sandrun
