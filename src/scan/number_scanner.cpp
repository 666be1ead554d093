#include "scan/number_scanner.hpp"

#include "common/text.hpp"

#include <algorithm>

namespace numparse {

NumberScanner::NumberScanner(std::string_view text, NumberStyle style, const NumberFormat& format)
    : text_(text), style_(style), format_(format) {}

// ============================================================================
// Character navigation
// ============================================================================

bool NumberScanner::at_end() const {
    return offset_ >= text_.size();
}

char NumberScanner::peek() const {
    if (at_end()) return '\0';
    return text_[offset_];
}

char NumberScanner::advance() {
    return text_[offset_++];
}

bool NumberScanner::match_char(char expected) {
    if (at_end() || peek() != expected) return false;
    advance();
    return true;
}

void NumberScanner::skip_white() {
    while (!at_end() && is_white(peek())) {
        advance();
    }
}

// ============================================================================
// Numeral scanning
// ============================================================================

ParseResult<ScannedNumber> NumberScanner::scan() {
    offset_ = 0;
    ScannedNumber number;

    if (allows(NumberStyle::AllowLeadingWhite)) {
        skip_white();
    }

    if (allows(NumberStyle::AllowLeadingSign)) {
        if (match_char(format_.negative_sign)) {
            number.negative = true;
        } else {
            match_char(format_.positive_sign);
        }
    }

    if (!scan_mantissa(number)) {
        return ParseResult<ScannedNumber>::err(error_here());
    }

    if (allows(NumberStyle::AllowExponent) && (peek() == 'e' || peek() == 'E')) {
        uint32_t marker = offset_;
        if (!scan_exponent(number)) {
            // An exponent marker without digits is not part of the numeral
            offset_ = marker;
            return ParseResult<ScannedNumber>::err(error_here());
        }
    }

    if (allows(NumberStyle::AllowTrailingWhite)) {
        skip_white();
    }

    if (!at_end()) {
        return ParseResult<ScannedNumber>::err(error_here());
    }

    auto first_significant = std::find_if(number.digits.begin(), number.digits.end(),
                                          [](char c) { return c != '0'; });
    number.digits.erase(number.digits.begin(), first_significant);

    return ParseResult<ScannedNumber>::ok(std::move(number));
}

bool NumberScanner::scan_mantissa(ScannedNumber& number) {
    bool has_digits = false;

    // Integer part; group separators only after the first digit
    while (!at_end()) {
        char c = peek();
        if (is_digit(c)) {
            number.digits.push_back(advance());
            has_digits = true;
        } else if (has_digits && c == format_.group_separator &&
                   allows(NumberStyle::AllowThousands)) {
            advance();
        } else {
            break;
        }
    }

    // Fraction part
    int64_t fraction_length = 0;
    if (allows(NumberStyle::AllowDecimalPoint) && match_char(format_.decimal_separator)) {
        while (!at_end() && is_digit(peek())) {
            number.digits.push_back(advance());
            ++fraction_length;
            has_digits = true;
        }
    }

    number.exponent = -fraction_length;
    return has_digits;
}

bool NumberScanner::scan_exponent(ScannedNumber& number) {
    advance(); // consume e/E

    bool negative = false;
    if (match_char(format_.negative_sign)) {
        negative = true;
    } else {
        match_char(format_.positive_sign);
    }

    bool has_exp_digits = false;
    int64_t exponent = 0;
    while (!at_end() && is_digit(peek())) {
        exponent = std::min(exponent * 10 + (advance() - '0'), kExponentLimit);
        has_exp_digits = true;
    }
    if (!has_exp_digits) return false;

    number.exponent += negative ? -exponent : exponent;
    return true;
}

// ============================================================================
// Symbols
// ============================================================================

ScannedNumber scan_special_symbol(std::string_view text, const NumberFormat& format) {
    ScannedNumber number;
    std::string_view body = trim(text);

    if (!body.empty() && body.front() == format.negative_sign) {
        number.negative = true;
        body.remove_prefix(1);
    } else if (!body.empty() && body.front() == format.positive_sign) {
        body.remove_prefix(1);
    }

    if (equals_ignore_case(body, format.infinity_symbol) || body == format.infinity_glyph) {
        number.special = SpecialValue::Infinity;
    } else if (equals_ignore_case(body, format.nan_symbol)) {
        number.special = SpecialValue::NaN;
    }
    return number;
}

} // namespace numparse
