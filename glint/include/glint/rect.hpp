#pragma once
#include <glm/vec2.hpp>

namespace glint {
using Extent2D = glm::uvec2;

///
/// \brief Axis-aligned rectangle in screen space (+y down): lt is the top-left corner, rb the bottom-right.
///
template <typename Type = float>
struct Rect2D {
	glm::tvec2<Type> lt{};
	glm::tvec2<Type> rb{};

	static constexpr Rect2D from_extent(glm::tvec2<Type> extent, glm::tvec2<Type> top_left = {}) { return {.lt = top_left, .rb = top_left + extent}; }

	constexpr glm::tvec2<Type> extent() const { return rb - lt; }

	bool operator==(Rect2D const&) const = default;
};

using UvRect = Rect2D<float>;

inline constexpr UvRect uv_rect_v{.lt = {0.0f, 0.0f}, .rb = {1.0f, 1.0f}};
} // namespace glint
