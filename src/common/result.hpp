#pragma once

#include <string>
#include <utility>
#include <variant>

namespace numparse {

/// A simple Result type for error handling.
/// Carries either a parsed value or the reason the conversion failed.
template <typename T, typename E = std::string>
class Result {
public:
    /// Construct a success result.
    [[nodiscard]] static Result ok(T value) { return Result(std::move(value)); }

    /// Construct an error result.
    [[nodiscard]] static Result err(E error) { return Result(InError{std::move(error)}); }

    /// Check if this is a success result.
    [[nodiscard]] bool is_ok() const { return std::holds_alternative<T>(data_); }

    /// Check if this is an error result.
    [[nodiscard]] bool is_err() const { return std::holds_alternative<InError>(data_); }

    /// Get the success value. Throws std::bad_variant_access if is_err().
    [[nodiscard]] T& value() & { return std::get<T>(data_); }
    [[nodiscard]] const T& value() const& { return std::get<T>(data_); }
    [[nodiscard]] T&& value() && { return std::get<T>(std::move(data_)); }

    /// Get the success value, or `fallback` if this is an error.
    [[nodiscard]] T value_or(T fallback) const& {
        return is_ok() ? std::get<T>(data_) : std::move(fallback);
    }

    /// Get the error value. Throws std::bad_variant_access if is_ok().
    [[nodiscard]] E& error() & { return std::get<InError>(data_).err; }
    [[nodiscard]] const E& error() const& { return std::get<InError>(data_).err; }

    /// Explicit bool conversion: true if ok.
    [[nodiscard]] explicit operator bool() const { return is_ok(); }

private:
    // Wrap E so T and E can be the same type
    struct InError {
        E err;
    };

    explicit Result(T value) : data_(std::move(value)) {}
    explicit Result(InError error) : data_(std::move(error)) {}

    std::variant<T, InError> data_;
};

} // namespace numparse
