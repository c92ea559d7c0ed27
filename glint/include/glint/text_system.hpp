#pragma once
#include <glint/font/font_library.hpp>
#include <glint/glyph_pen.hpp>
#include <memory>

namespace glint {
struct TextSystemCreateInfo {
	GlyphCache::CreateInfo cache{};
	float scale{1.0f};
};

///
/// \brief Per-window text context: the active face and the glyph cache / atlases it renders into.
///
/// Owns no global state: each window holds its own TextSystem (and thus its own scale factor and atlases).
///
class TextSystem {
  public:
	using CreateInfo = TextSystemCreateInfo;

	explicit TextSystem(CreateInfo const& create_info = {});

	///
	/// \brief Make face the active font; clears the glyph cache.
	///
	void load_font(std::unique_ptr<FontFace> face);
	///
	/// \brief Load a font file through library and make it active.
	///
	/// Throws InvalidFontName / FontNotFound (the active font is unchanged on failure).
	///
	void load_font(FontLibrary const& library, std::string_view path, float point_size);

	bool has_font() const { return m_loaded; }
	FontFace& face() const { return *m_face; }
	Metrics const& metrics() const { return m_face->metrics(); }

	CachedGlyph glyph(GlyphId glyph_id) { return m_cache.get_or_render(*m_face, glyph_id); }
	CachedGlyph glyph_for(Codepoint const codepoint) { return glyph(m_face->glyph_index(codepoint)); }

	void set_scale_factor(float scale) { m_cache.set_scale_factor(scale); }
	float scale_factor() const { return m_cache.scale_factor(); }

	GlyphCache const& cache() const { return m_cache; }
	Atlas const& atlas() const { return m_cache.atlas(); }
	std::uint32_t generation() const { return m_cache.generation(); }
	///
	/// \brief Colour atlas, if any colour glyph has been cached.
	///
	Ptr<Atlas const> colour_atlas() const { return m_cache.colour_atlas(); }
	///
	/// \brief Generation of the colour atlas (0 until it exists).
	///
	std::uint32_t colour_generation() const { return m_cache.colour_atlas() ? m_cache.colour_atlas()->generation() : 0u; }

	TextMeasurement measure(std::span<ShapedGlyph const> run) const { return measure_run(run, m_face->metrics()); }
	///
	/// \brief Obtain a pen writing with the active face.
	///
	/// The pen refers to the current face: it must not be used after load_font() replaces it.
	///
	GlyphPen pen(glm::vec2 baseline = {}) { return GlyphPen{&m_cache, m_face.get(), baseline}; }

  private:
	std::unique_ptr<FontFace> m_face{};
	GlyphCache m_cache;
	bool m_loaded{};
	Logger m_logger{"TextSystem"};
};
} // namespace glint
