#ifndef CASCADE_UTIL_MIME_H
#define CASCADE_UTIL_MIME_H

#include <string>
#include <string_view>

namespace cascade::util {

/**
 * @brief Looks up the MIME type for a file extension or shorthand
 * ("json", ".png", "index.html"). Returns an empty string when unknown.
 */
std::string mime_type(std::string_view name);

/**
 * @brief Full Content-Type value for a type, shorthand or extension.
 *
 * Textual types get "; charset=utf-8" appended unless a charset is already
 * present: content_type("text") == "text/plain; charset=utf-8".
 */
std::string content_type(std::string_view type);

} // namespace cascade::util

#endif
