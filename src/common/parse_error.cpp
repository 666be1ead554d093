#include "common/parse_error.hpp"

#include <fmt/format.h>

namespace numparse {

std::string_view parse_error_kind_to_string(ParseErrorKind kind) {
    switch (kind) {
    case ParseErrorKind::NullArgument: return "null argument";
    case ParseErrorKind::Format:       return "format error";
    case ParseErrorKind::Overflow:     return "overflow error";
    }
    return "unknown error";
}

std::string format_parse_error(const ParseError& error) {
    return fmt::format("offset {}: {}: {}", error.offset,
                       parse_error_kind_to_string(error.kind), error.message);
}

void throw_parse_error(const ParseError& error) {
    switch (error.kind) {
    case ParseErrorKind::NullArgument:
        throw NullArgumentError(error.message);
    case ParseErrorKind::Format:
        throw FormatError(error.message);
    case ParseErrorKind::Overflow:
        throw OverflowError(error.message);
    }
    throw ParseException(error.kind, fmt::format("unknown parse error: {}", error.message));
}

} // namespace numparse
