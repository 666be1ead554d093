#pragma once

#include "common/parse_error.hpp"
#include "scan/number_scanner.hpp"

#include <gmpxx.h>

#include <compare>
#include <cstdint>
#include <string>

namespace numparse {

/// A base-10 number: sign, coefficient below 2^96, and a scale of 0..28.
/// Value = (-1)^sign * coefficient / 10^scale.
///
/// Comparison is numeric, so 1.10 == 1.1; the scale only affects
/// to_string(). Zero is never negative.
class Decimal {
public:
    static constexpr uint32_t kMaxScale = 28;

    Decimal() = default;

    /// `units` / 10^scale. Throws std::out_of_range if scale > kMaxScale.
    explicit Decimal(int64_t units, uint32_t scale = 0);

    /// Round a scanned numeral to a Decimal. Fails with Overflow when the
    /// integral part does not fit, and with Format for infinity or NaN.
    [[nodiscard]] static ParseResult<Decimal> from_scanned(const ScannedNumber& number);

    /// Largest representable coefficient, 2^96 - 1.
    [[nodiscard]] static const mpz_class& max_coefficient();

    [[nodiscard]] bool is_negative() const { return negative_; }
    [[nodiscard]] bool is_zero() const { return sgn(coefficient_) == 0; }
    [[nodiscard]] uint32_t scale() const { return scale_; }
    [[nodiscard]] const mpz_class& coefficient() const { return coefficient_; }

    /// Plain notation keeping the scale, e.g. "-1.10".
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] bool operator==(const Decimal& other) const;
    [[nodiscard]] std::strong_ordering operator<=>(const Decimal& other) const;

private:
    Decimal(mpz_class coefficient, uint32_t scale, bool negative);

    mpz_class coefficient_;
    uint32_t scale_ = 0;
    bool negative_ = false;
};

} // namespace numparse
