#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace numparse {

/// Text argument of every conversion function.
/// Distinguishes an absent input (null pointer or std::nullopt) from an
/// empty one. Does not own the characters it views.
class InputText {
public:
    InputText(std::nullopt_t) noexcept {}
    InputText(const char* str) noexcept
        : view_(str ? std::string_view(str) : std::string_view{}), null_(str == nullptr) {}
    InputText(std::string_view str) noexcept : view_(str), null_(false) {}
    InputText(const std::string& str) noexcept : view_(str), null_(false) {}

    [[nodiscard]] bool is_null() const { return null_; }

    /// The viewed characters. Empty when is_null().
    [[nodiscard]] std::string_view view() const { return view_; }

    /// Byte-exact comparison with a literal. An absent input equals nothing.
    [[nodiscard]] bool equals(std::string_view literal) const {
        return !null_ && view_ == literal;
    }

private:
    std::string_view view_;
    bool null_ = true;
};

} // namespace numparse
