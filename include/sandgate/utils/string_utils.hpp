/**
 * @file string_utils.hpp
 * @brief Small string helpers shared by the engine client and the tools
 *
 * Used for normalizing identities and image references coming from tool
 * arguments, parsing engine host addresses and HTTP headers, and shaping
 * engine error bodies for logs and tool results.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace sandgate {
namespace utils {

/**
 * @class StringUtils
 * @brief Stateless string helpers
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * std::string id = StringUtils::Trim("  3f2a9c1b  ");        // "3f2a9c1b"
 * if (StringUtils::StartsWith(host, "unix://")) { ... }
 * std::string shown = StringUtils::Truncate(body, 512);
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * Basic String Manipulation
     ***************************************************************************/

    /**
     * @brief Trim whitespace from both ends of string
     * @param str Input string
     * @return Trimmed string
     */
    static std::string Trim(const std::string& str);

    /**
     * @brief Convert string to lowercase (ASCII)
     */
    static std::string ToLower(const std::string& str);

    /**
     * @brief Join strings with delimiter
     *
     * @param strings Strings to join
     * @param delimiter Separator placed between elements
     * @return Joined string
     *
     * **Example**:
     * @code
     * StringUtils::Join({"sleep", "infinity"}, " ");  // "sleep infinity"
     * @endcode
     */
    static std::string Join(const std::vector<std::string>& strings, const std::string& delimiter);

    /***************************************************************************
     * String Checking
     ***************************************************************************/

    /**
     * @brief Check if string starts with prefix
     * @param str String to check
     * @param prefix Prefix to test
     * @return true if str starts with prefix
     */
    static bool StartsWith(const std::string& str, const std::string& prefix);

    /**
     * @brief Check if string ends with suffix
     * @param str String to check
     * @param suffix Suffix to test
     * @return true if str ends with suffix
     */
    static bool EndsWith(const std::string& str, const std::string& suffix);

    /**
     * @brief Check if string contains substring
     */
    static bool Contains(const std::string& str, const std::string& substring);

    /***************************************************************************
     * Utility Functions
     ***************************************************************************/

    /**
     * @brief Truncate string to maximum length
     *
     * The result, suffix included, is never longer than @p max_length.
     *
     * @param str Input string
     * @param max_length Maximum allowed length
     * @param suffix Suffix to append if truncated (default: "...")
     * @return Truncated string
     */
    static std::string Truncate(const std::string& str, std::size_t max_length,
                                const std::string& suffix = "...");
};

} // namespace utils
} // namespace sandgate
