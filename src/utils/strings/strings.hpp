#pragma once
#include <string>
#include <string_view>

/**
 * @brief Namespace containing helper functions for string manipulation.
 *
 * The `utils::strings` namespace provides the small set of operations the
 * argument parser needs: quote stripping, blank detection and ASCII case
 * folding.
 */
namespace utils::strings {

/**
 * @brief Checks if the given string is empty or consists of whitespace only.
 * @param value The string to check.
 * @return `true` if the string is blank, `false` otherwise.
 */
bool IsBlank(std::string_view value);

/**
 * @brief Removes one pair of surrounding double quotes.
 *
 * Single quotes are part of the value. A value without such a pair is
 * returned unchanged.
 *
 * @param value The string to unquote.
 * @return The unquoted string.
 */
std::string UnQuote(std::string_view value);

/**
 * @brief Converts the given string to lower case (ASCII only).
 * @param value The string to convert.
 * @return The lower case copy.
 */
std::string ToLower(std::string_view value);

/**
 * @brief Compares two strings ignoring ASCII case.
 * @param left The first string.
 * @param right The second string.
 * @return `true` if both strings are equal ignoring case.
 */
bool EqualsIgnoreCase(std::string_view left, std::string_view right);

/**
 * @brief Strict weak ordering ignoring ASCII case, usable as a map comparator.
 */
struct CaseInsensitiveLess {
  using is_transparent = void;

  bool operator()(std::string_view left, std::string_view right) const;
};

} // namespace utils::strings
