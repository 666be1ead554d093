#pragma once

#include "common/result.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace numparse {

/// Why a conversion failed.
enum class ParseErrorKind : uint8_t {
    NullArgument, // input absent, not merely empty
    Format,       // text is not a valid numeral
    Overflow,     // valid numeral outside the target range
};

[[nodiscard]] std::string_view parse_error_kind_to_string(ParseErrorKind kind);

inline constexpr std::string_view kNullArgumentMessage = "Value cannot be null. (Parameter 'str')";
inline constexpr std::string_view kFormatMessage       = "Error! Format Exception!";
inline constexpr std::string_view kOverflowMessage     = "Error! Overflow Exception!";

/// A failed conversion.
struct ParseError {
    ParseErrorKind kind = ParseErrorKind::Format;
    std::string message;
    uint32_t offset = 0; // byte offset into the input where reading stopped

    [[nodiscard]] static ParseError null_argument() {
        return ParseError{ParseErrorKind::NullArgument, std::string(kNullArgumentMessage), 0};
    }

    [[nodiscard]] static ParseError format(uint32_t offset = 0) {
        return ParseError{ParseErrorKind::Format, std::string(kFormatMessage), offset};
    }

    [[nodiscard]] static ParseError overflow(uint32_t offset = 0) {
        return ParseError{ParseErrorKind::Overflow, std::string(kOverflowMessage), offset};
    }

    [[nodiscard]] bool operator==(const ParseError&) const = default;
};

template <typename T>
using ParseResult = Result<T, ParseError>;

/// Format an error for display: "offset N: <kind>: <message>".
[[nodiscard]] std::string format_parse_error(const ParseError& error);

// ============================================================================
// Exceptions for callers that want throwing semantics
// ============================================================================

class ParseException : public std::runtime_error {
public:
    ParseException(ParseErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    [[nodiscard]] ParseErrorKind kind() const noexcept { return kind_; }

private:
    ParseErrorKind kind_;
};

class NullArgumentError : public ParseException {
public:
    explicit NullArgumentError(const std::string& what)
        : ParseException(ParseErrorKind::NullArgument, what) {}
};

class FormatError : public ParseException {
public:
    explicit FormatError(const std::string& what)
        : ParseException(ParseErrorKind::Format, what) {}
};

class OverflowError : public ParseException {
public:
    explicit OverflowError(const std::string& what)
        : ParseException(ParseErrorKind::Overflow, what) {}
};

/// Throw the exception matching `error.kind`.
[[noreturn]] void throw_parse_error(const ParseError& error);

/// Return the parsed value or throw the exception matching the error.
template <typename T>
[[nodiscard]] T unwrap_or_throw(ParseResult<T> result) {
    if (result.is_err()) {
        throw_parse_error(result.error());
    }
    return std::move(result).value();
}

} // namespace numparse
