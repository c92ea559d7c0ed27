#pragma once
#include <cstdint>

namespace glint {
enum struct Codepoint : std::uint32_t {
	eNull = 0u,
	eSpace = 32u,
	eAsciiStart = eSpace,
	eAsciiEnd = 126u,
	eMax = 0x10ffffu,
};

///
/// \brief Font-internal glyph index.
///
enum struct GlyphId : std::uint16_t {
	eMissing = 0u,
};
} // namespace glint
