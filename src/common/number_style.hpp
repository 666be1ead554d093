#pragma once

#include <cstdint>
#include <string_view>

namespace numparse {

/// Permitted elements of a numeral. Combine with `|`.
enum class NumberStyle : uint16_t {
    None               = 0,
    AllowLeadingWhite  = 1 << 0,
    AllowTrailingWhite = 1 << 1,
    AllowLeadingSign   = 1 << 2,
    AllowDecimalPoint  = 1 << 3,
    AllowThousands     = 1 << 4,
    AllowExponent      = 1 << 5,

    Integer = AllowLeadingWhite | AllowTrailingWhite | AllowLeadingSign,
    Float   = Integer | AllowDecimalPoint | AllowExponent,
    Number  = Integer | AllowDecimalPoint | AllowThousands,
    Any     = Float | AllowThousands,
};

[[nodiscard]] constexpr NumberStyle operator|(NumberStyle a, NumberStyle b) {
    return static_cast<NumberStyle>(static_cast<uint16_t>(a) | static_cast<uint16_t>(b));
}

[[nodiscard]] constexpr NumberStyle operator&(NumberStyle a, NumberStyle b) {
    return static_cast<NumberStyle>(static_cast<uint16_t>(a) & static_cast<uint16_t>(b));
}

/// True if every flag of `flags` is set in `style`.
[[nodiscard]] constexpr bool has_style(NumberStyle style, NumberStyle flags) {
    return (style & flags) == flags;
}

/// Symbols used when reading a numeral.
struct NumberFormat {
    char positive_sign      = '+';
    char negative_sign      = '-';
    char decimal_separator  = '.';
    char group_separator    = ',';
    std::string_view infinity_symbol = "Infinity";
    std::string_view nan_symbol      = "NaN";
    std::string_view infinity_glyph  = "\xE2\x88\x9E"; // U+221E in UTF-8

    /// The culture-neutral format. All conversion functions use it.
    [[nodiscard]] static constexpr NumberFormat invariant() { return NumberFormat{}; }
};

} // namespace numparse
