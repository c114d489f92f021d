/**
 * @file string_utils.h
 * @brief String manipulation utilities
 *
 * Small string helpers shared by the format converters.
 *
 * @version 1.0.0
 */

#pragma once

#include <string>
#include <cstddef>

namespace typesys {
namespace utils {

/**
 * @brief Convert string to lowercase (ASCII only)
 *
 * @param str Input string
 * @return Lowercase string
 */
std::string toLower(const std::string& str);

/**
 * @brief Check if string starts with prefix
 *
 * @param str Input string
 * @param prefix Prefix to check
 * @return true if str starts with prefix
 */
bool startsWith(const std::string& str, const std::string& prefix);

/**
 * @brief Check if string ends with suffix
 *
 * @param str Input string
 * @param suffix Suffix to check
 * @return true if str ends with suffix
 */
bool endsWith(const std::string& str, const std::string& suffix);

/**
 * @brief Replace all occurrences of substring
 *
 * @param str Input string
 * @param from Substring to replace (empty: no-op)
 * @param to Replacement string
 * @return String with replacements
 */
std::string replaceAll(const std::string& str, const std::string& from, const std::string& to);

/**
 * @brief Right-pad string with a fill character up to a width
 *
 * Strings already at or beyond the width are returned unchanged.
 *
 * @param str Input string
 * @param width Target width
 * @param fill Fill character
 * @return Padded string
 */
std::string padRight(const std::string& str, size_t width, char fill);

/**
 * @brief Zero-pad a non-negative number on the left
 *
 * @param value Number to render
 * @param width Minimum number of digits
 * @return e.g. zeroPad(7, 2) == "07"
 */
std::string zeroPad(long long value, int width);

} // namespace utils
} // namespace typesys
