#ifndef LAMINA_ASSERT_HPP
#define LAMINA_ASSERT_HPP

#include "ulight/impl/assert.hpp"

namespace lamina {

using ulight::assert_fail;
using ulight::Assertion_Error;
using ulight::Assertion_Error_Type;

#define LAMINA_ASSERT(...) ULIGHT_ASSERT(__VA_ARGS__)
#define LAMINA_DEBUG_ASSERT(...) ULIGHT_DEBUG_ASSERT(__VA_ARGS__)

#define LAMINA_ASSERT_UNREACHABLE(...) ULIGHT_ASSERT_UNREACHABLE(__VA_ARGS__)
#define LAMINA_DEBUG_ASSERT_UNREACHABLE(...) ULIGHT_DEBUG_ASSERT_UNREACHABLE(__VA_ARGS__)

} // namespace lamina

#endif
