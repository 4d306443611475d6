#ifndef LAMINA_FUNCTION_REF_HPP
#define LAMINA_FUNCTION_REF_HPP

#include "ulight/function_ref.hpp"

namespace lamina {

/// @brief A non-owning reference to a callable,
/// used for predicates and visitors that do not outlive the call they are passed to.
template <typename F>
using Function_Ref = ulight::Function_Ref<F>;

} // namespace lamina

#endif
