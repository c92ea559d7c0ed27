#pragma once
#include <glint/font/common.hpp>
#include <glint/rect.hpp>

namespace glint {
///
/// \brief Face-wide metrics, computed once at load time.
///
/// All lengths are in logical units (points): descender is positive (below baseline),
/// underline_position is negative when below baseline.
///
struct Metrics {
	std::uint32_t units_per_em{};
	float ascender{};
	float descender{};
	float line_gap{};
	float cap_height{};
	float x_height{};
	float underline_position{};
	float underline_thickness{};
	float line_height{};
	float point_size{};
	bool monospace{};
	///
	/// \brief Advance of the widest of 'M' and '0'.
	///
	float cell_width{};
};

struct GlyphMetrics {
	GlyphId glyph_id{};
	glm::vec2 advance{};
	glm::vec2 bearing{};
	glm::vec2 extent{};
};

///
/// \brief Result of rasterizing a glyph into a caller-owned buffer.
///
struct RasterizedGlyph {
	///
	/// \brief Written pixels (physical); 0x0 for ink-less glyphs.
	///
	Extent2D extent{};
	///
	/// \brief Offset from pen to left edge (x) and baseline to top edge (y), logical.
	///
	glm::vec2 bearing{};
	float logical_height{};
	float advance_x{};
	///
	/// \brief If true the buffer holds RGBA pixels, otherwise single channel coverage.
	///
	bool colour{};
	///
	/// \brief Physical pixels per logical unit of the written bitmap.
	///
	/// Equal to the requested scale, except for fixed-strike faces whose nearest strike differs from point_size * scale.
	///
	float scale{};
};

///
/// \brief One positioned glyph of a shaped run, as produced by a text shaper.
///
struct ShapedGlyph {
	GlyphId glyph_id{};
	float x_offset{};
	float y_offset{};
	float x_advance{};
	float y_advance{};
	std::uint32_t cluster{};
};

struct TextMeasurement {
	float width{};
	float height{};
	std::uint32_t line_count{1};
};
} // namespace glint
