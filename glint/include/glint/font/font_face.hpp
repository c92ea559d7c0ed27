#pragma once
#include <glint/font/metrics.hpp>
#include <glint/util/id.hpp>
#include <glint/util/pinned.hpp>
#include <cstddef>
#include <span>

namespace glint {
///
/// \brief Capability interface over a loaded font resource.
///
/// Concrete backends (FreeType, Null, ...) are only named when constructing one.
/// Every instance carries a process-unique Id: glyph caches key on it, never on names or addresses.
///
class FontFace : public Pinned {
  public:
	using Id = glint::Id<FontFace>;
	struct Null;

	///
	/// \brief Maximum bytes per pixel written by render_glyph() (RGBA colour glyphs).
	///
	static constexpr std::uint32_t max_channels_v{4};

	///
	/// \brief Minimum buffer size (in bytes) required by render_glyph() for a given capacity edge.
	///
	static constexpr std::size_t buffer_size_for(std::uint32_t const capacity_edge) {
		return static_cast<std::size_t>(capacity_edge) * capacity_edge * max_channels_v;
	}

	virtual ~FontFace() = default;

	Id id() const { return m_id; }
	Metrics const& metrics() const { return m_metrics; }

	///
	/// \brief Map a Unicode scalar to a glyph id.
	/// \returns GlyphId::eMissing if unmapped
	///
	virtual GlyphId glyph_index(Codepoint codepoint) const = 0;
	///
	/// \brief Obtain unscaled metrics for a glyph (logical units).
	///
	virtual GlyphMetrics glyph_metrics(GlyphId glyph_id) const = 0;
	///
	/// \brief Rasterize a glyph at point_size * scale into buffer (row-major).
	///
	/// Bitmap-only faces render their nearest fixed strike instead; the returned scale and logical
	/// values describe the glyph at point_size regardless.
	/// \param buffer Caller-owned storage, at least buffer_size_for(capacity_edge) bytes
	/// \param capacity_edge Maximum width / height to write; larger glyphs are clamped
	/// \returns Written extent (possibly 0x0), bearings and scale used
	///
	/// Throws RasterizationError if the backend cannot render into a surface.
	///
	virtual RasterizedGlyph render_glyph(GlyphId glyph_id, float scale, std::span<std::byte> buffer, std::uint32_t capacity_edge) = 0;

	GlyphMetrics codepoint_metrics(Codepoint const codepoint) const { return glyph_metrics(glyph_index(codepoint)); }

  protected:
	FontFace();

	Metrics m_metrics{};

  private:
	Id m_id{};
};

///
/// \brief Face that maps nothing and renders nothing.
///
struct FontFace::Null : FontFace {
	explicit Null(float point_size = 16.0f);

	GlyphId glyph_index(Codepoint) const final { return GlyphId::eMissing; }
	GlyphMetrics glyph_metrics(GlyphId glyph_id) const final { return {.glyph_id = glyph_id}; }
	RasterizedGlyph render_glyph(GlyphId, float scale, std::span<std::byte>, std::uint32_t) final { return {.scale = scale}; }
};
} // namespace glint
