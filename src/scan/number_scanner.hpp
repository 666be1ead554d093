#pragma once

#include "common/number_style.hpp"
#include "common/parse_error.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace numparse {

enum class SpecialValue : uint8_t {
    None,
    Infinity,
    NaN,
};

/// A numeral that passed syntax checking.
/// Its value is digits x 10^exponent, negated if `negative`.
struct ScannedNumber {
    bool negative = false;
    std::string digits;   // significant digits, no leading zeros; empty means zero
    int64_t exponent = 0;
    SpecialValue special = SpecialValue::None;

    [[nodiscard]] bool is_zero() const {
        return special == SpecialValue::None && digits.empty();
    }
};

/// Reads one numeral spanning the whole input under a NumberStyle.
class NumberScanner {
public:
    /// Exponents are clamped to this magnitude while reading.
    static constexpr int64_t kExponentLimit = 1'000'000'000;

    NumberScanner(std::string_view text, NumberStyle style,
                  const NumberFormat& format = NumberFormat::invariant());

    /// Scan the input. Fails with a Format error at the first offending byte.
    [[nodiscard]] ParseResult<ScannedNumber> scan();

private:
    std::string_view text_;
    NumberStyle style_;
    NumberFormat format_;
    uint32_t offset_ = 0;

    [[nodiscard]] bool at_end() const;
    [[nodiscard]] char peek() const;
    char advance();
    bool match_char(char expected);
    [[nodiscard]] bool allows(NumberStyle flag) const { return has_style(style_, flag); }

    void skip_white();
    bool scan_mantissa(ScannedNumber& number);
    bool scan_exponent(ScannedNumber& number);
    [[nodiscard]] ParseError error_here() const { return ParseError::format(offset_); }
};

/// Recognise an infinity or NaN symbol, with optional sign, in `text`
/// (surrounding white space ignored). Returns a ScannedNumber with
/// special == None if `text` is not a symbol.
[[nodiscard]] ScannedNumber scan_special_symbol(std::string_view text,
                                                const NumberFormat& format = NumberFormat::invariant());

} // namespace numparse
