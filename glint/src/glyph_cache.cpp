#include <glint/glyph_cache.hpp>
#include <glint/util/error.hpp>
#include <glint/util/hash_combine.hpp>
#include <algorithm>
#include <cassert>
#include <cmath>

namespace glint {
namespace {
constexpr float scale_epsilon_v{1e-4f};

constexpr std::uint8_t quantize_scale(float const scale) {
	return static_cast<std::uint8_t>(std::clamp(scale, GlyphCache::min_scale_v, GlyphCache::max_scale_v));
}
} // namespace

GlyphKey GlyphKey::make(FontFace const& face, GlyphId const glyph_id, float const scale) {
	return GlyphKey{
		.face = face.id(),
		.glyph_id = glyph_id,
		.size_fixed = static_cast<std::uint32_t>(std::max(face.metrics().point_size, 0.0f) * 64.0f),
		.scale_fixed = quantize_scale(scale),
	};
}

std::size_t GlyphKey::Hasher::operator()(GlyphKey const& key) const {
	return make_combined_hash(key.face.value(), static_cast<std::uint16_t>(key.glyph_id), key.size_fixed, key.scale_fixed);
}

GlyphCache::GlyphCache(float const scale, CreateInfo const& create_info)
	: m_grayscale(PixelFormat::eGrayscale, create_info.atlas), m_scratch(FontFace::buffer_size_for(create_info.scratch_edge)),
	  m_atlas_info(create_info.atlas), m_scratch_edge(create_info.scratch_edge), m_scale(scale) {
	assert(m_scratch_edge > 0 && m_scale > 0.0f);
}

CachedGlyph GlyphCache::get_or_render(FontFace& face, GlyphId const glyph_id) {
	auto const key = GlyphKey::make(face, glyph_id, m_scale);
	if (auto const it = m_map.find(key); it != m_map.end()) { return it->second; }

	auto const ret = render(face, glyph_id);
	m_map.insert_or_assign(key, ret);
	m_logger.debug("cached glyph [{}] [{}x{}] at [{}, {}]", static_cast<int>(glyph_id), ret.region.width, ret.region.height, ret.region.x, ret.region.y);
	return ret;
}

void GlyphCache::set_scale_factor(float const scale) {
	if (std::abs(scale - m_scale) < scale_epsilon_v) { return; }
	assert(scale > 0.0f);
	m_logger.info("scale factor [{}] => [{}], dropping [{}] glyphs", m_scale, scale, m_map.size());
	m_scale = scale;
	clear();
}

void GlyphCache::clear() {
	m_map.clear();
	m_grayscale.clear();
	if (m_colour) { m_colour->clear(); }
	++m_epoch;
}

CachedGlyph GlyphCache::render(FontFace& face, GlyphId const glyph_id) {
	// scratch is sized for the largest glyph: stale margins of a previous glyph must not leak
	m_scratch.fill(std::byte{});
	auto const rasterized = face.render_glyph(glyph_id, m_scale, m_scratch.span(), m_scratch_edge);
	assert(rasterized.extent.x <= m_scratch_edge && rasterized.extent.y <= m_scratch_edge);

	auto ret = CachedGlyph{
		.bearing = rasterized.bearing,
		.height = rasterized.logical_height,
		.advance_x = rasterized.advance_x,
		.colour = rasterized.colour,
		.scale = rasterized.scale,
	};
	if (rasterized.extent.x == 0 || rasterized.extent.y == 0) { return ret; }

	auto& atlas = target_atlas(rasterized.colour);
	auto const byte_count = static_cast<std::size_t>(rasterized.extent.x) * rasterized.extent.y * atlas.channels();
	auto const pixels = std::span<std::byte const>{m_scratch.data(), byte_count};
	ret.region = inscribe(atlas, rasterized.extent, pixels);
	return ret;
}

Region GlyphCache::inscribe(Atlas& atlas, Extent2D const extent, std::span<std::byte const> pixels) {
	auto region = atlas.reserve(extent);
	if (!region) {
		if (!atlas.grow()) {
			throw AtlasFull{fmt::format("no space for [{}x{}] in [{}x{}] atlas", extent.x, extent.y, atlas.size().x, atlas.size().y)};
		}
		// growth discarded every region: drop all entries in the same step
		clear();
		region = atlas.reserve(extent);
		if (!region) {
			throw AtlasFull{fmt::format("no space for [{}x{}] in grown [{}x{}] atlas", extent.x, extent.y, atlas.size().x, atlas.size().y)};
		}
	}
	atlas.set(*region, pixels);
	return *region;
}

Atlas& GlyphCache::target_atlas(bool const colour) {
	if (!colour) { return m_grayscale; }
	if (!m_colour) {
		m_logger.info("creating colour atlas [{}x{}]", m_atlas_info.initial_extent.x, m_atlas_info.initial_extent.y);
		m_colour.emplace(PixelFormat::eRgba, m_atlas_info);
	}
	return *m_colour;
}
} // namespace glint
