#pragma once

#include "common/input_text.hpp"
#include "common/parse_error.hpp"
#include "real/decimal.hpp"

namespace numparse {

// ============================================================================
// Try-parse: on failure `result` is set to zero.
//
// float32/float64 accept white space, a leading sign, ',' group separators,
// a '.' fraction and an exponent, plus the Infinity/NaN symbols. Results
// are correctly rounded; out-of-range magnitudes become infinity or zero.
//
// decimal accepts the same numerals without the symbols. It fails when the
// integral part needs more than 96 bits.
// ============================================================================

[[nodiscard]] bool try_parse_float32(InputText str, float& result);
[[nodiscard]] bool try_parse_float64(InputText str, double& result);
[[nodiscard]] bool try_parse_decimal(InputText str, Decimal& result);

// ============================================================================
// Parse: absent input is a NullArgument error.
// ============================================================================

/// Empty or unparsable text gives NaN. Infinities pass through. A zero
/// result is +0 unless the trimmed input is exactly "-0".
[[nodiscard]] ParseResult<float> parse_float32(InputText str);

/// Empty or unparsable text gives the smallest positive subnormal.
/// Otherwise as parse_float32.
[[nodiscard]] ParseResult<double> parse_float64(InputText str);

/// Empty text or "abc" (any case) gives -1.1, white space gives 0,
/// anything unparsable and the literal "78237827873287328732" give -2.2.
[[nodiscard]] ParseResult<Decimal> parse_decimal(InputText str);

} // namespace numparse
