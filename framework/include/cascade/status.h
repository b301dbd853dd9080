#ifndef CASCADE_STATUS_H
#define CASCADE_STATUS_H

#include <string_view>

namespace cascade::status {

/**
 * @brief Canonical reason phrase for a status code, empty when unknown.
 */
std::string_view message(int code);

/** @brief True when the code is a known HTTP status. */
bool is_valid(int code);

/** @brief Codes whose responses never carry a payload (204, 205, 304). */
bool is_empty(int code);

/** @brief Redirect codes (300, 301, 302, 303, 305, 307, 308). */
bool is_redirect(int code);

/** @brief Codes worth retrying (502, 503, 504). */
bool is_retry(int code);

} // namespace cascade::status

#endif
