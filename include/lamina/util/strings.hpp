#ifndef LAMINA_STRINGS_HPP
#define LAMINA_STRINGS_HPP

#include <charconv>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

#include "ulight/impl/ascii_chars.hpp"

#include "lamina/util/assert.hpp"

namespace lamina {

using ulight::is_ascii_alpha;
using ulight::is_ascii_alphanumeric;
using ulight::is_ascii_digit;
using ulight::is_ascii_hex_digit;

[[nodiscard]]
inline std::string_view as_string_view(std::u8string_view str)
{
    return { reinterpret_cast<const char*>(str.data()), str.size() };
}

[[nodiscard]]
inline std::u8string_view as_u8string_view(std::string_view text)
{
    return { reinterpret_cast<const char8_t*>(text.data()), text.size() };
}

[[nodiscard]]
constexpr std::u8string_view as_u8string_view(std::span<const char8_t> text)
{
    return { text.data(), text.size() };
}

/// @brief Returns `true` if `str` is a non-empty ASCII identifier,
/// i.e. it consists of letters, digits, and underscores,
/// and does not begin with a digit.
[[nodiscard]]
constexpr bool is_ascii_identifier(std::u8string_view str)
{
    if (str.empty() || is_ascii_digit(str[0])) {
        return false;
    }
    for (const char8_t c : str) { // NOLINT(readability-use-anyofallof)
        if (c != u8'_' && !is_ascii_alphanumeric(c)) {
            return false;
        }
    }
    return true;
}

/// @brief Appends the decimal representation of `x` to `out`.
template <typename String, typename Number>
void append_number(String& out, Number x)
{
    char buffer[64];
    const std::to_chars_result result = std::to_chars(buffer, buffer + sizeof(buffer), x);
    LAMINA_ASSERT(result.ec == std::errc {});
    const std::string_view chars { buffer, result.ptr };
    out.append(as_u8string_view(chars));
}

} // namespace lamina

#endif
