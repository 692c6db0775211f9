#pragma once

#include <kj/string.h>
#include <kj/vector.h>

namespace rio::http {

/**
 * @brief ASCII text helpers shared by the header parsers and the config loader.
 *
 * HTTP tokens are ASCII, so none of these look at the locale.
 */

/**
 * @brief Space or horizontal tab (HTTP optional whitespace).
 */
bool is_space(char c);

bool is_digit(char c);

char to_lower(char c);

/**
 * @brief Copy of s without leading and trailing spaces and tabs.
 */
kj::String trim(kj::StringPtr s);

kj::String lowercase(kj::StringPtr s);

kj::String uppercase(kj::StringPtr s);

/**
 * @brief ASCII case-insensitive comparison (header names, codings).
 */
bool equals_ignore_case(kj::StringPtr a, kj::StringPtr b);

/**
 * @brief Split on a separator. Always yields at least one (possibly empty) piece.
 */
kj::Vector<kj::String> split(kj::StringPtr text, char separator);

/**
 * @brief Comma-separated list with every item trimmed and blank items dropped.
 *
 * "a, b,,c " -> ["a", "b", "c"]
 */
kj::Vector<kj::String> split_list(kj::StringPtr text);

} // namespace rio::http
