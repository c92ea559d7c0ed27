#include <glint/glyph_pen.hpp>
#include <glint/util/error.hpp>

namespace glint {
namespace {
constexpr int max_rebuilds_v{8};
} // namespace

TextMeasurement measure_run(std::span<ShapedGlyph const> run, Metrics const& metrics) {
	auto ret = TextMeasurement{.height = metrics.line_height};
	for (auto const& glyph : run) { ret.width += glyph.x_advance; }
	return ret;
}

GlyphPen::GlyphPen(NotNull<GlyphCache*> cache, NotNull<FontFace*> face, glm::vec2 const baseline) : cursor(baseline), m_cache(cache), m_face(face) {}

std::vector<GlyphQuad> GlyphPen::write(std::span<ShapedGlyph const> run) {
	auto const start = cursor;
	auto ret = std::vector<GlyphQuad>{};
	for (int attempt = 0; attempt < max_rebuilds_v; ++attempt) {
		auto const epoch = m_cache->epoch();
		cursor = start;
		ret.clear();
		try {
			write_once(run, ret);
		} catch (AtlasFull const&) {
			cursor = start;
			throw;
		}
		if (m_cache->epoch() == epoch) { return ret; }
		m_logger.debug("glyph cache invalidated mid-run, rebuilding [{}] glyphs", run.size());
	}
	cursor = start;
	throw AtlasFull{fmt::format("glyph run of [{}] glyphs does not fit in the atlas", run.size())};
}

std::optional<CachedGlyph> GlyphPen::glyph_for(GlyphId const glyph_id) {
	try {
		return m_cache->get_or_render(*m_face, glyph_id);
	} catch (RasterizationError const& e) {
		m_logger.warn("{}", e.what());
		return {};
	} catch (AtlasFull const& e) {
		if (glyph_id == GlyphId::eMissing) { throw; }
		m_logger.warn("{}, substituting missing glyph", e.what());
		return m_cache->get_or_render(*m_face, GlyphId::eMissing);
	}
}

void GlyphPen::write_once(std::span<ShapedGlyph const> run, std::vector<GlyphQuad>& out) {
	out.reserve(run.size());
	for (auto const& shaped : run) {
		auto const glyph = glyph_for(shaped.glyph_id);
		if (glyph && !glyph->region.is_empty()) {
			auto const top_left = glm::vec2{cursor.x + shaped.x_offset + glyph->bearing.x, cursor.y - shaped.y_offset - glyph->bearing.y};
			auto const extent = glm::vec2{static_cast<float>(glyph->region.width) / glyph->scale, glyph->height};
			out.push_back(GlyphQuad{
				.rect = Rect2D<>::from_extent(extent, top_left),
				.uv = m_cache->atlas_for(*glyph).uv_rect_for(glyph->region),
				.colour = glyph->colour,
				.cluster = shaped.cluster,
			});
		}
		cursor.x += shaped.x_advance;
	}
}
} // namespace glint
