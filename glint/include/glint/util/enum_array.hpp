#pragma once
#include <cstddef>
#include <type_traits>

namespace glint {
template <typename Type>
concept EnumT = std::is_enum_v<Type>;

///
/// \brief Stores an array of Type, of size Size, indexable by enum E.
///
template <EnumT E, typename Type, std::size_t Size = static_cast<std::size_t>(E::eCOUNT_)>
struct EnumArray {
	Type t[Size]{};

	constexpr Type& operator[](E const e) { return t[static_cast<std::size_t>(e)]; }
	constexpr Type const& operator[](E const e) const { return t[static_cast<std::size_t>(e)]; }
};
} // namespace glint
