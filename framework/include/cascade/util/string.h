#ifndef CASCADE_UTIL_STRING_H
#define CASCADE_UTIL_STRING_H

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cascade::util {

/**
 * @brief Decodes a URL-encoded string (e.g., %20 to space).
 * Handles both '+' and '%xx' encodings.
 */
std::string url_decode(std::string_view str);

/**
 * @brief Parses "a=1&b=2" into a map, decoding keys and values.
 * Later duplicates overwrite earlier ones.
 */
std::unordered_map<std::string, std::string> parse_query(std::string_view query);

std::string to_lower(std::string_view input);

std::string_view trim(std::string_view input);

bool iequals(std::string_view a, std::string_view b);

/** @brief Splits on a delimiter, trimming each piece and dropping empty ones. */
std::vector<std::string> split_list(std::string_view input, char delimiter = ',');

/**
 * @brief Prefixes every line of text, including the first.
 */
std::string indent(std::string_view text, std::string_view prefix = "  ");

/** @brief RFC 7231 IMF-fixdate, e.g. "Tue, 15 Nov 1994 12:45:26 GMT". */
std::string format_http_date(std::chrono::system_clock::time_point time);

std::optional<std::chrono::system_clock::time_point> parse_http_date(std::string_view text);

} // namespace cascade::util

#endif // CASCADE_UTIL_STRING_H
