#ifndef LAMINA_RESULT_HPP
#define LAMINA_RESULT_HPP

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

#include "lamina/util/assert.hpp"

#include "lamina/fwd.hpp"

namespace lamina {

struct Success_Tag { };
inline constexpr Success_Tag success_tag;

struct Error_Tag { };
inline constexpr Error_Tag error_tag;

/// @brief Either a value of type `T` or an error of type `E`.
/// Both alternatives are implicitly constructible,
/// so a function returning `Result<T, E>` can simply `return value;` or `return error;`.
/// `T` and `E` shall not be the same type.
template <typename T, typename E>
struct Result {
    static_assert(!std::is_same_v<T, E>, "Value and error types must be distinct.");

    using value_type = T;
    using error_type = E;

private:
    std::variant<T, E> m_storage;

public:
    [[nodiscard]]
    constexpr Result(const T& value)
        : m_storage { std::in_place_index<0>, value }
    {
    }

    [[nodiscard]]
    constexpr Result(T&& value)
        : m_storage { std::in_place_index<0>, std::move(value) }
    {
    }

    [[nodiscard]]
    constexpr Result(const E& error)
        : m_storage { std::in_place_index<1>, error }
    {
    }

    [[nodiscard]]
    constexpr Result(E&& error)
        : m_storage { std::in_place_index<1>, std::move(error) }
    {
    }

    template <typename... Args>
    [[nodiscard]]
    constexpr explicit Result(Success_Tag, Args&&... args)
        : m_storage { std::in_place_index<0>, std::forward<Args>(args)... }
    {
    }

    template <typename... Args>
    [[nodiscard]]
    constexpr explicit Result(Error_Tag, Args&&... args)
        : m_storage { std::in_place_index<1>, std::forward<Args>(args)... }
    {
    }

    [[nodiscard]]
    constexpr bool has_value() const noexcept
    {
        return m_storage.index() == 0;
    }

    [[nodiscard]]
    constexpr explicit operator bool() const noexcept
    {
        return has_value();
    }

    [[nodiscard]]
    constexpr T& value() &
    {
        LAMINA_ASSERT(has_value());
        return *std::get_if<0>(&m_storage);
    }
    [[nodiscard]]
    constexpr const T& value() const&
    {
        LAMINA_ASSERT(has_value());
        return *std::get_if<0>(&m_storage);
    }
    [[nodiscard]]
    constexpr T&& value() &&
    {
        LAMINA_ASSERT(has_value());
        return std::move(*std::get_if<0>(&m_storage));
    }

    [[nodiscard]]
    constexpr E& error() &
    {
        LAMINA_ASSERT(!has_value());
        return *std::get_if<1>(&m_storage);
    }
    [[nodiscard]]
    constexpr const E& error() const&
    {
        LAMINA_ASSERT(!has_value());
        return *std::get_if<1>(&m_storage);
    }
    [[nodiscard]]
    constexpr E&& error() &&
    {
        LAMINA_ASSERT(!has_value());
        return std::move(*std::get_if<1>(&m_storage));
    }

    [[nodiscard]]
    constexpr T& operator*() &
    {
        return value();
    }
    [[nodiscard]]
    constexpr const T& operator*() const&
    {
        return value();
    }
    [[nodiscard]]
    constexpr T&& operator*() &&
    {
        return std::move(*this).value();
    }

    [[nodiscard]]
    constexpr T* operator->()
    {
        return &value();
    }
    [[nodiscard]]
    constexpr const T* operator->() const
    {
        return &value();
    }

    [[nodiscard]]
    friend constexpr bool operator==(const Result&, const Result&) = default;
};

template <typename E>
struct Result<void, E> {
    using value_type = void;
    using error_type = E;

private:
    std::optional<E> m_error;

public:
    [[nodiscard]]
    constexpr Result() noexcept
        = default;

    [[nodiscard]]
    constexpr Result(Success_Tag) noexcept
    {
    }

    [[nodiscard]]
    constexpr Result(const E& error)
        : m_error { error }
    {
    }

    [[nodiscard]]
    constexpr Result(E&& error)
        : m_error { std::move(error) }
    {
    }

    template <typename... Args>
    [[nodiscard]]
    constexpr explicit Result(Error_Tag, Args&&... args)
        : m_error { std::in_place, std::forward<Args>(args)... }
    {
    }

    [[nodiscard]]
    constexpr bool has_value() const noexcept
    {
        return !m_error.has_value();
    }

    [[nodiscard]]
    constexpr explicit operator bool() const noexcept
    {
        return has_value();
    }

    constexpr void value() const
    {
        LAMINA_ASSERT(has_value());
    }

    constexpr void operator*() const
    {
        value();
    }

    [[nodiscard]]
    constexpr E& error() &
    {
        LAMINA_ASSERT(!has_value());
        return *m_error;
    }
    [[nodiscard]]
    constexpr const E& error() const&
    {
        LAMINA_ASSERT(!has_value());
        return *m_error;
    }
    [[nodiscard]]
    constexpr E&& error() &&
    {
        LAMINA_ASSERT(!has_value());
        return std::move(*m_error);
    }

    [[nodiscard]]
    friend constexpr bool operator==(const Result&, const Result&) = default;
};

} // namespace lamina

#endif
