#ifndef LAMINA_JSON_HPP
#define LAMINA_JSON_HPP

#include <algorithm>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "lamina/attribute_value.hpp"
#include "lamina/fwd.hpp"

namespace lamina::json {

using lamina::Null;
using lamina::null;

using String = std::pmr::u8string;
using Integer = lamina::Integer;
using Number = double;

struct Array : std::pmr::vector<Value> {
    explicit constexpr Array(
        std::pmr::memory_resource* memory = std::pmr::get_default_resource()
    ) noexcept;

    [[nodiscard]]
    friend constexpr bool operator==(const Array&, const Array&)
        = default;
};

struct Object : std::pmr::vector<Member> {
    explicit constexpr Object(
        std::pmr::memory_resource* memory = std::pmr::get_default_resource()
    ) noexcept;

    [[nodiscard]]
    friend constexpr bool operator==(const Object&, const Object&)
        = default;

    [[nodiscard]]
    constexpr const Member* find(std::u8string_view key) const noexcept;
    [[nodiscard]]
    constexpr Member* find(std::u8string_view key) noexcept
    {
        return const_cast<Member*>(std::as_const(*this).find(key)); // NOLINT
    }

    [[nodiscard]]
    constexpr const Value* find_value(std::u8string_view key) const noexcept;

    [[nodiscard]]
    constexpr const bool* find_bool(std::u8string_view key) const noexcept
    {
        return find_alternative<bool>(key);
    }

    [[nodiscard]]
    constexpr const String* find_string(std::u8string_view key) const noexcept
    {
        return find_alternative<String>(key);
    }

    [[nodiscard]]
    constexpr const Object* find_object(std::u8string_view key) const noexcept
    {
        return find_alternative<Object>(key);
    }

    [[nodiscard]]
    constexpr const Array* find_array(std::u8string_view key) const noexcept
    {
        return find_alternative<Array>(key);
    }

    /// @brief Appends a member.
    /// Keys are not checked for uniqueness.
    void emplace(std::u8string_view key, Value&& value);

private:
    template <typename T>
    [[nodiscard]]
    constexpr const T* find_alternative(std::u8string_view key) const noexcept;
};

/// @brief A JSON value.
/// Numbers without fraction or exponent that fit into `Integer` are stored as `Integer`,
/// all other numbers as `Number`.
using Value_Variant = std::variant<Null, bool, Integer, Number, String, Array, Object>;

struct Value : Value_Variant {
    using Value_Variant::variant;

    [[nodiscard]]
    bool operator==(const Value&) const
        = default;

    [[nodiscard]]
    const Null* as_null() const noexcept
    {
        return std::get_if<Null>(this);
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
    const Number* as_number() const noexcept
    {
        return std::get_if<Number>(this);
    }
    [[nodiscard]]
    const String* as_string() const noexcept
    {
        return std::get_if<String>(this);
    }
    [[nodiscard]]
    const Object* as_object() const noexcept
    {
        return std::get_if<Object>(this);
    }
    [[nodiscard]]
    const Array* as_array() const noexcept
    {
        return std::get_if<Array>(this);
    }
};

struct Member {
    String key;
    Value value;

    [[nodiscard]]
    friend constexpr bool operator==(const Member&, const Member&)
        = default;
};

constexpr Array::Array(std::pmr::memory_resource* memory) noexcept
    : std::pmr::vector<Value> { memory }
{
}

constexpr Object::Object(std::pmr::memory_resource* memory) noexcept
    : std::pmr::vector<Member> { memory }
{
}

constexpr const Member* Object::find(std::u8string_view key) const noexcept
{
    const auto it = std::ranges::find(*this, key, &Member::key);
    return it == end() ? nullptr : &*it;
}

constexpr const Value* Object::find_value(std::u8string_view key) const noexcept
{
    const Member* const member = find(key);
    return member ? &member->value : nullptr;
}

inline void Object::emplace(std::u8string_view key, Value&& value)
{
    push_back({ String { key, get_allocator() }, std::move(value) });
}

template <typename T>
constexpr const T* Object::find_alternative(std::u8string_view key) const noexcept
{
    const Member* const member = find(key);
    return member ? std::get_if<T>(&member->value) : nullptr;
}

/// @brief Parses `source` as JSON.
/// Returns `std::nullopt` if `source` is not valid JSON.
[[nodiscard]]
std::optional<json::Value> load(std::u8string_view source, std::pmr::memory_resource* memory);

/// @brief Appends the compact JSON representation of `value` to `out`.
/// Floating-point numbers always carry a fraction or exponent,
/// so that loading the output yields the same alternatives.
void write(std::pmr::u8string& out, const json::Value& value);

/// @brief Converts an attribute value to JSON.
[[nodiscard]]
json::Value to_json(const Attribute_Value& value, std::pmr::memory_resource* memory);

/// @brief Converts a JSON scalar to an attribute value.
/// Returns `std::nullopt` for arrays and objects.
[[nodiscard]]
std::optional<Attribute_Value>
to_attribute_value(const json::Value& value, std::pmr::memory_resource* memory);

} // namespace lamina::json

#endif
