#pragma once

#include <string_view>

namespace numparse {

/// White space accepted around a numeral: U+0009..U+000D and U+0020.
[[nodiscard]] constexpr bool is_white(char c) {
    return c == ' ' || (c >= '\t' && c <= '\r');
}

[[nodiscard]] constexpr bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

/// Strip leading and trailing white space.
[[nodiscard]] std::string_view trim(std::string_view text);

/// True for empty text and text made only of white space.
[[nodiscard]] bool is_null_or_whitespace(std::string_view text);

/// ASCII case-insensitive equality. Non-ASCII bytes must match exactly.
[[nodiscard]] bool equals_ignore_case(std::string_view a, std::string_view b);

} // namespace numparse
