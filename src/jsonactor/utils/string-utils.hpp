#pragma once

#include <string>
#include <string_view>

/**
 * @defgroup jsonactor-strings Strings
 * @ingroup jsonactor-utils
 */
namespace jsonactor {

// ------------------------------------------------------------------------ Trim

std::string_view trim_leading(std::string_view s, char ch);

// ------------------------------------------------------------------------ UTF8
/**
 * @ingroup jsonactor-strings
 * @brief true iff `s` is well-formed UTF-8.
 *
 * Overlong encodings, surrogate code points (U+D800..U+DFFF), and code points
 * beyond U+10FFFF are all rejected.
 */
bool is_valid_utf8(std::string_view s) noexcept;

} // namespace jsonactor
