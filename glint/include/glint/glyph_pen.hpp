#pragma once
#include <glint/glyph_cache.hpp>
#include <glint/util/not_null.hpp>
#include <span>
#include <vector>

namespace glint {
///
/// \brief Textured quad for one inked glyph, in logical units (+y down).
///
struct GlyphQuad {
	Rect2D<> rect{};
	UvRect uv{};
	///
	/// \brief Whether uv refers to the colour atlas.
	///
	bool colour{};
	std::uint32_t cluster{};
};

///
/// \brief Total advance of a shaped run; height is the face's line height.
///
TextMeasurement measure_run(std::span<ShapedGlyph const> run, Metrics const& metrics);

///
/// \brief Lays out shaped glyph runs along a baseline, producing quads for a renderer.
///
class GlyphPen {
  public:
	GlyphPen(NotNull<GlyphCache*> cache, NotNull<FontFace*> face, glm::vec2 baseline = {});

	///
	/// \brief Write a shaped run starting at cursor, and advance cursor past it.
	///
	/// Glyphs that fail to rasterize are skipped; glyphs that do not fit in the atlas are replaced by the missing glyph.
	/// If the cache is invalidated during the run (atlas growth) the run is rebuilt so that every quad refers to live regions.
	/// ShapedGlyph offsets are +y up (shaper convention), quads +y down.
	/// Throws AtlasFull if the run cannot be placed; cursor is left unchanged in that case.
	///
	std::vector<GlyphQuad> write(std::span<ShapedGlyph const> run);
	TextMeasurement measure(std::span<ShapedGlyph const> run) const { return measure_run(run, m_face->metrics()); }

	glm::vec2 cursor{};

  private:
	std::optional<CachedGlyph> glyph_for(GlyphId glyph_id);
	void write_once(std::span<ShapedGlyph const> run, std::vector<GlyphQuad>& out);

	NotNull<GlyphCache*> m_cache;
	NotNull<FontFace*> m_face;
	Logger m_logger{"GlyphPen"};
};
} // namespace glint
