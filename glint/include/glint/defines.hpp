#pragma once

namespace glint {
constexpr bool debug_v =
#if defined(GLINT_DEBUG)
	true;
#else
	false;
#endif

constexpr bool freetype_v =
#if defined(GLINT_USE_FREETYPE)
	true;
#else
	false;
#endif
} // namespace glint
