#pragma once

namespace glint {
///
/// \brief Alias for a single, non-owning pointer.
///
/// Purely a signal for readers (and syntactic sugar like auto x = Ptr<Foo>{}).
/// Using Ptr<T> for anything except "pointer to T" is undefined behavior (eg pointer arithmetic).
///
template <typename T>
using Ptr = T*;
} // namespace glint
