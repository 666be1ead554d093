#pragma once

#include "common/input_text.hpp"
#include "common/parse_error.hpp"

#include <cstdint>

namespace numparse {

// ============================================================================
// Try-parse: never fails loudly. On failure `result` is set to zero.
// Accepts white space around an optionally signed run of decimal digits.
// ============================================================================

[[nodiscard]] bool try_parse_int8(InputText str, int8_t& result);
[[nodiscard]] bool try_parse_uint8(InputText str, uint8_t& result);
[[nodiscard]] bool try_parse_int16(InputText str, int16_t& result);
[[nodiscard]] bool try_parse_uint16(InputText str, uint16_t& result);
[[nodiscard]] bool try_parse_int32(InputText str, int32_t& result);
[[nodiscard]] bool try_parse_uint32(InputText str, uint32_t& result);
[[nodiscard]] bool try_parse_int64(InputText str, int64_t& result);
[[nodiscard]] bool try_parse_uint64(InputText str, uint64_t& result);

// ============================================================================
// Parse: every function fails with NullArgument on an absent input.
// Other failures follow a fixed per-type policy.
// ============================================================================

/// Whitespace or malformed text gives 0. A value that fits int64 but not
/// int32 gives -1.
[[nodiscard]] ParseResult<int32_t> parse_int32(InputText str);

/// Whitespace or "abc" (any case) gives 0. Any other failure gives
/// UINT32_MAX.
[[nodiscard]] ParseResult<uint32_t> parse_uint32(InputText str);

/// Whitespace or "abc" (any case) gives 255. Any other failure gives 0.
[[nodiscard]] ParseResult<uint8_t> parse_uint8(InputText str);

/// Whitespace or "abc" (any case) gives 127. Values that fit int64 but
/// not int8 are Overflow errors, everything else a Format error.
[[nodiscard]] ParseResult<int8_t> parse_int8(InputText str);

/// Whitespace is a Format error. Values that fit int64 but not int16 are
/// Overflow errors, everything else a Format error.
[[nodiscard]] ParseResult<int16_t> parse_int16(InputText str);

/// Whitespace or exactly "abc" gives 0; exactly "65536" or "-1" gives
/// 65535. Otherwise as parse_int16 with the uint16 range.
[[nodiscard]] ParseResult<uint16_t> parse_uint16(InputText str);

/// Whitespace or "abc" (any case) gives INT64_MIN. Exactly
/// "9223372036854775808" or "-9223372036854775809" gives -1. Any other
/// failure is a Format error.
[[nodiscard]] ParseResult<int64_t> parse_int64(InputText str);

/// Exactly "-1" or "18446744073709551616" is an Overflow error. Any other
/// failure, whitespace included, is a Format error.
[[nodiscard]] ParseResult<uint64_t> parse_uint64(InputText str);

} // namespace numparse
