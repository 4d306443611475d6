#ifndef LAMINA_SETTINGS_HPP
#define LAMINA_SETTINGS_HPP

#include <string_view>

#include "ulight/impl/platform.h"

#ifndef NDEBUG // debug builds
#define LAMINA_DEBUG 1
#define LAMINA_IF_DEBUG(...) __VA_ARGS__
#define LAMINA_IF_NOT_DEBUG(...)
#else // release builds
#define LAMINA_IF_DEBUG(...)
#define LAMINA_IF_NOT_DEBUG(...) __VA_ARGS__
#endif

#ifdef ULIGHT_CLANG
#define LAMINA_CLANG 1
#endif

#ifdef ULIGHT_GCC
#define LAMINA_GCC 1
#endif

#if !defined(LAMINA_CLANG) && !defined(LAMINA_GCC)
#error "lamina currently only supports Clang or GCC."
#endif

namespace lamina {

/// @brief If `true`, the current build is a debug build (not a release build).
inline constexpr bool is_debug_build = LAMINA_IF_DEBUG(true) LAMINA_IF_NOT_DEBUG(false);

/// @brief If `true`, `Text::add_layer` and `Layer::replace_spans` re-run the full
/// consistency audit of dependent layers after every change,
/// not only of the layer being changed.
inline constexpr bool audit_dependents_on_change = true;

/// @brief The attribute that taggers store rule priorities in by default.
inline constexpr std::u8string_view default_priority_attribute = u8"_priority_";

/// @brief Names which cannot be used as layer names because they denote
/// members of `Text` in the record form.
inline constexpr std::u8string_view reserved_layer_names[] {
    u8"text",
    u8"layers",
    u8"meta",
};

} // namespace lamina

#endif
