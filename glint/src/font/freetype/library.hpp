#pragma once
#include <glint/font/font_library.hpp>
#include <glint/util/logger.hpp>
#include <memory>
#include <optional>

#if !defined(GLINT_USE_FREETYPE)
#error "invalid project configuration"
#endif

#include <ft2build.h>
#include FT_FREETYPE_H

namespace glint {
class FreetypeFace : public FontFace {
  public:
	///
	/// \brief Shared ownership of the FT_Library: every face keeps its library alive.
	///
	using Lib = std::shared_ptr<FT_LibraryRec_>;

	FreetypeFace(Lib lib, FT_Face face, ByteArray bytes, float point_size);
	~FreetypeFace() override;

	GlyphId glyph_index(Codepoint codepoint) const final;
	GlyphMetrics glyph_metrics(GlyphId glyph_id) const final;
	RasterizedGlyph render_glyph(GlyphId glyph_id, float scale, std::span<std::byte> buffer, std::uint32_t capacity_edge) final;

  private:
	struct SizeGuard;

	///
	/// \brief Set the active size: scalable outlines directly, bitmap-only faces via the nearest strike.
	/// \returns Requested size / rendered size (1 for outlines), nullopt on failure
	///
	std::optional<float> set_size(float point_size) const;
	Metrics make_metrics(float point_size);

	Lib m_lib{};
	FT_Face m_face{};
	ByteArray m_bytes{};
	///
	/// \brief Requested / rendered size at the base point size.
	///
	float m_size_ratio{1.0f};
	Logger m_logger{"Freetype"};
};

class Freetype : public FontLibrary {
  public:
	Freetype(Freetype const&) = delete;
	Freetype(Freetype&&) = delete;
	Freetype& operator=(Freetype const&) = delete;
	Freetype& operator=(Freetype&&) = delete;

	Freetype();

	std::unique_ptr<FontFace> load(ByteArray bytes, float point_size) const final;

  private:
	FreetypeFace::Lib m_lib{};
};
} // namespace glint
