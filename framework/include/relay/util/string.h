#ifndef RELAY_UTIL_STRING_H
#define RELAY_UTIL_STRING_H

#include <string>
#include <string_view>

namespace relay::util {

/**
 * @brief Decodes %XX escapes in a path or path segment.
 *
 * '+' is kept literally; malformed escapes are copied through unchanged.
 */
std::string percent_decode(std::string_view str);

/**
 * @brief Escapes the bytes that cannot appear raw in a URL path: controls,
 * space, non-ASCII and " # < > ? ` { }. Everything else, '%' included, is
 * copied as-is.
 */
std::string encode_path(std::string_view str);

/**
 * @brief Media type of a Content-Type value: parameters dropped, surrounding
 * whitespace trimmed, lowercased ("Application/JSON; charset=utf-8" gives
 * "application/json").
 */
std::string media_type(std::string_view content_type);

} // namespace relay::util

#endif // RELAY_UTIL_STRING_H
