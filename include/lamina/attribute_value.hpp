#ifndef LAMINA_ATTRIBUTE_VALUE_HPP
#define LAMINA_ATTRIBUTE_VALUE_HPP

#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "lamina/fwd.hpp"

namespace lamina {

struct Null {
    [[nodiscard]]
    friend constexpr bool operator==(Null, Null)
        = default;
};
inline constexpr Null null;

using String = std::pmr::u8string;

using Attribute_Value_Variant = std::variant<Null, bool, Integer, Float, String>;

/// @brief The value of one attribute of an annotation.
/// Integers and floating-point numbers are distinct alternatives,
/// so `Integer(1)` and `Float(1)` are not equal.
struct Attribute_Value : Attribute_Value_Variant {
    using Attribute_Value_Variant::variant;

    [[nodiscard]]
    Attribute_Value() noexcept
        : Attribute_Value_Variant { Null {} }
    {
    }

    [[nodiscard]]
    Attribute_Value(int x) noexcept
        : Attribute_Value_Variant { std::in_place_type<Integer>, x }
    {
    }

    [[nodiscard]]
    Attribute_Value(
        std::u8string_view str,
        std::pmr::memory_resource* memory = std::pmr::get_default_resource()
    )
        : Attribute_Value_Variant { std::in_place_type<String>, str, memory }
    {
    }

    [[nodiscard]]
    Attribute_Value(const char8_t* str)
        : Attribute_Value { std::u8string_view { str } }
    {
    }

    [[nodiscard]]
    bool operator==(const Attribute_Value&) const
        = default;

    [[nodiscard]]
    bool is_null() const noexcept
    {
        return std::holds_alternative<Null>(*this);
    }
    [[nodiscard]]
    bool is_number() const noexcept
    {
        return std::holds_alternative<Integer>(*this) || std::holds_alternative<Float>(*this);
    }

    [[nodiscard]]
    const bool* as_boolean() const noexcept
    {
        return std::get_if<bool>(this);
    }
    [[nodiscard]]
    const Integer* as_integer() const noexcept
    {
        return std::get_if<Integer>(this);
    }
    [[nodiscard]]
    const Float* as_float() const noexcept
    {
        return std::get_if<Float>(this);
    }
    [[nodiscard]]
    const String* as_string() const noexcept
    {
        return std::get_if<String>(this);
    }

    /// @brief Returns the value as a `double` if it holds an `Integer` or `Float`,
    /// otherwise `std::nullopt`.
    [[nodiscard]]
    std::optional<double> as_number() const noexcept
    {
        if (const auto* const i = as_integer()) {
            return double(*i);
        }
        if (const auto* const f = as_float()) {
            return *f;
        }
        return {};
    }
};

struct Attribute {
    String name;
    Attribute_Value value;

    [[nodiscard]]
    friend bool operator==(const Attribute&, const Attribute&)
        = default;
};

/// @brief Appends a human-readable representation of `value` to `out`.
/// Strings are appended verbatim, `Null` as `null`.
void append_display(std::pmr::u8string& out, const Attribute_Value& value);

} // namespace lamina

#endif
