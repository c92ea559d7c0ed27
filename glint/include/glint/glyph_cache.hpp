#pragma once
#include <glint/atlas.hpp>
#include <glint/font/font_face.hpp>
#include <glint/util/ptr.hpp>
#include <optional>
#include <unordered_map>

namespace glint {
///
/// \brief Identity of a renderable glyph instance.
///
/// Equal keys imply bit-identical bitmaps.
///
struct GlyphKey {
	FontFace::Id face{};
	GlyphId glyph_id{};
	///
	/// \brief Point size in 1/64 units.
	///
	std::uint32_t size_fixed{};
	///
	/// \brief Scale factor clamped to [1, 4] and truncated.
	///
	std::uint8_t scale_fixed{};

	static GlyphKey make(FontFace const& face, GlyphId glyph_id, float scale);

	bool operator==(GlyphKey const&) const = default;

	struct Hasher {
		std::size_t operator()(GlyphKey const& key) const;
	};
};

struct CachedGlyph {
	///
	/// \brief Location in atlas() (or colour_atlas() if colour); empty for ink-less glyphs.
	///
	Region region{};
	glm::vec2 bearing{};
	float height{};
	float advance_x{};
	bool colour{};
	float scale{};
};

struct GlyphCacheCreateInfo {
	static constexpr std::uint32_t scratch_edge_v{256};

	Atlas::CreateInfo atlas{};
	///
	/// \brief Largest glyph edge (physical pixels) that can be rasterized; larger glyphs are clamped.
	///
	std::uint32_t scratch_edge{scratch_edge_v};
};

///
/// \brief Memoizing map of rasterized glyphs backed by a grayscale and a (lazily created) colour Atlas.
///
/// Entries are never evicted individually: the whole cache is cleared when the scale factor changes,
/// when the owner switches fonts, and whenever an atlas has to grow.
///
class GlyphCache {
  public:
	using CreateInfo = GlyphCacheCreateInfo;

	static constexpr float min_scale_v{1.0f};
	static constexpr float max_scale_v{4.0f};

	explicit GlyphCache(float scale = 1.0f, CreateInfo const& create_info = {});

	///
	/// \brief Obtain a cached glyph, rasterizing and inserting it on a miss.
	///
	/// Throws RasterizationError if the face fails to render, AtlasFull if there is no
	/// space even after growing once. Growth clears all existing entries.
	///
	CachedGlyph get_or_render(FontFace& face, GlyphId glyph_id);
	bool contains(FontFace const& face, GlyphId glyph_id) const { return m_map.contains(GlyphKey::make(face, glyph_id, m_scale)); }

	///
	/// \brief Set the display scale factor; clears the cache if it changed.
	///
	void set_scale_factor(float scale);
	float scale_factor() const { return m_scale; }

	void clear();

	Atlas const& atlas() const { return m_grayscale; }
	Ptr<Atlas const> colour_atlas() const { return m_colour ? &*m_colour : nullptr; }
	Atlas const& atlas_for(CachedGlyph const& glyph) const { return glyph.colour && m_colour ? *m_colour : m_grayscale; }

	std::uint32_t generation() const { return m_grayscale.generation(); }
	///
	/// \brief Number of full invalidations (clears) so far.
	///
	std::uint64_t epoch() const { return m_epoch; }
	std::size_t size() const { return m_map.size(); }

  private:
	CachedGlyph render(FontFace& face, GlyphId glyph_id);
	Region inscribe(Atlas& atlas, Extent2D extent, std::span<std::byte const> pixels);
	Atlas& target_atlas(bool colour);

	std::unordered_map<GlyphKey, CachedGlyph, GlyphKey::Hasher> m_map{};
	Atlas m_grayscale;
	std::optional<Atlas> m_colour{};
	ByteArray m_scratch{};
	Atlas::CreateInfo m_atlas_info{};
	std::uint32_t m_scratch_edge{};
	std::uint64_t m_epoch{};
	float m_scale{};
	Logger m_logger{"GlyphCache"};
};
} // namespace glint
