#include "real/decimal.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace numparse {

namespace {

// The largest coefficient, 2^96 - 1, has 29 digits.
constexpr int64_t kMaxIntegralDigits = 29;

mpz_class pow10(unsigned long exponent) {
    mpz_class result;
    mpz_ui_pow_ui(result.get_mpz_t(), 10, exponent);
    return result;
}

/// Remove `drop` trailing digits from `value`, rounding half to even.
mpz_class round_off_digits(const mpz_class& value, uint64_t drop) {
    if (drop == 0) return value;
    if (drop > mpz_sizeinbase(value.get_mpz_t(), 10)) {
        // value < 10^(drop - 1): less than half of the last kept unit
        return mpz_class(0);
    }

    mpz_class divisor = pow10(static_cast<unsigned long>(drop));
    mpz_class quotient;
    mpz_class remainder;
    mpz_tdiv_qr(quotient.get_mpz_t(), remainder.get_mpz_t(), value.get_mpz_t(),
                divisor.get_mpz_t());

    mpz_class twice = remainder * 2;
    int c = cmp(twice, divisor);
    if (c > 0 || (c == 0 && mpz_odd_p(quotient.get_mpz_t()))) {
        ++quotient;
    }
    return quotient;
}

} // namespace

Decimal::Decimal(int64_t units, uint32_t scale) : scale_(scale), negative_(units < 0) {
    if (scale > kMaxScale) {
        throw std::out_of_range(fmt::format("decimal scale {} exceeds {}", scale, kMaxScale));
    }
    mpz_class value(static_cast<long>(units));
    coefficient_ = abs(value);
}

Decimal::Decimal(mpz_class coefficient, uint32_t scale, bool negative)
    : coefficient_(std::move(coefficient)), scale_(scale), negative_(negative) {}

const mpz_class& Decimal::max_coefficient() {
    static const mpz_class max = (mpz_class(1) << 96) - 1;
    return max;
}

ParseResult<Decimal> Decimal::from_scanned(const ScannedNumber& number) {
    using R = ParseResult<Decimal>;
    if (number.special != SpecialValue::None) {
        return R::err(ParseError::format());
    }

    const std::string& digits = number.digits;
    const int64_t exponent = number.exponent;

    if (digits.empty()) {
        auto scale = static_cast<uint32_t>(std::clamp<int64_t>(-exponent, 0, kMaxScale));
        return R::ok(Decimal(mpz_class(0), scale, false));
    }

    if (static_cast<int64_t>(digits.size()) + exponent > kMaxIntegralDigits) {
        return R::err(ParseError::overflow());
    }

    mpz_class coefficient(digits, 10);
    uint32_t scale = 0;
    if (exponent >= 0) {
        coefficient *= pow10(static_cast<unsigned long>(exponent));
    } else {
        int64_t fraction = -exponent;
        if (fraction > static_cast<int64_t>(kMaxScale)) {
            coefficient = round_off_digits(coefficient, static_cast<uint64_t>(fraction - kMaxScale));
            fraction = kMaxScale;
        }
        scale = static_cast<uint32_t>(fraction);
    }

    // Trade fraction digits for range while the coefficient is too wide
    while (coefficient > max_coefficient() && scale > 0) {
        coefficient = round_off_digits(coefficient, 1);
        --scale;
    }
    if (coefficient > max_coefficient()) {
        return R::err(ParseError::overflow());
    }

    bool negative = number.negative && sgn(coefficient) != 0;
    return R::ok(Decimal(std::move(coefficient), scale, negative));
}

std::string Decimal::to_string() const {
    std::string digits = coefficient_.get_str();
    if (scale_ > 0) {
        if (digits.size() <= scale_) {
            digits.insert(0, scale_ + 1 - digits.size(), '0');
        }
        digits.insert(digits.size() - scale_, 1, '.');
    }
    return fmt::format("{}{}", negative_ ? "-" : "", digits);
}

bool Decimal::operator==(const Decimal& other) const {
    return (*this <=> other) == 0;
}

std::strong_ordering Decimal::operator<=>(const Decimal& other) const {
    if (negative_ != other.negative_) {
        return negative_ ? std::strong_ordering::less : std::strong_ordering::greater;
    }

    int c = 0;
    if (scale_ == other.scale_) {
        c = cmp(coefficient_, other.coefficient_);
    } else if (scale_ < other.scale_) {
        mpz_class widened = coefficient_ * pow10(other.scale_ - scale_);
        c = cmp(widened, other.coefficient_);
    } else {
        mpz_class widened = other.coefficient_ * pow10(scale_ - other.scale_);
        c = cmp(coefficient_, widened);
    }
    if (negative_) c = -c;

    if (c < 0) return std::strong_ordering::less;
    if (c > 0) return std::strong_ordering::greater;
    return std::strong_ordering::equal;
}

} // namespace numparse
