#include <font/freetype/library.hpp>
#include <glint/util/error.hpp>
#include <algorithm>
#include <cassert>
#include <cmath>
#include FT_TRUETYPE_TABLES_H

namespace glint {
namespace {
constexpr float from_26_6(FT_Pos const value) { return static_cast<float>(value) / 64.0f; }
constexpr FT_F26Dot6 to_26_6(float const value) { return static_cast<FT_F26Dot6>(value * 64.0f); }

// pitch is negative for bottom-up bitmaps, where buffer points at the last row.
unsigned char const* row_ptr(FT_Bitmap const& bitmap, std::uint32_t const row) {
	auto const pitch = static_cast<std::ptrdiff_t>(bitmap.pitch);
	auto const* top = pitch < 0 ? bitmap.buffer - pitch * static_cast<std::ptrdiff_t>(bitmap.rows - 1) : bitmap.buffer;
	return top + pitch * static_cast<std::ptrdiff_t>(row);
}

void copy_gray(FT_Bitmap const& bitmap, std::span<std::byte> out, Extent2D const extent) {
	for (std::uint32_t y = 0; y < extent.y; ++y) {
		auto const* src = row_ptr(bitmap, y);
		auto* dst = out.data() + static_cast<std::size_t>(y) * extent.x;
		std::transform(src, src + extent.x, dst, [](unsigned char const c) { return static_cast<std::byte>(c); });
	}
}

void copy_mono(FT_Bitmap const& bitmap, std::span<std::byte> out, Extent2D const extent) {
	for (std::uint32_t y = 0; y < extent.y; ++y) {
		auto const* src = row_ptr(bitmap, y);
		auto* dst = out.data() + static_cast<std::size_t>(y) * extent.x;
		for (std::uint32_t x = 0; x < extent.x; ++x) {
			auto const bit = (src[x >> 3] >> (7 - (x & 7))) & 1;
			dst[x] = bit ? std::byte{0xff} : std::byte{0x00};
		}
	}
}

void copy_bgra(FT_Bitmap const& bitmap, std::span<std::byte> out, Extent2D const extent) {
	for (std::uint32_t y = 0; y < extent.y; ++y) {
		auto const* src = row_ptr(bitmap, y);
		auto* dst = out.data() + static_cast<std::size_t>(y) * extent.x * 4;
		for (std::uint32_t x = 0; x < extent.x; ++x) {
			auto const* bgra = src + x * 4;
			dst[x * 4 + 0] = static_cast<std::byte>(bgra[2]);
			dst[x * 4 + 1] = static_cast<std::byte>(bgra[1]);
			dst[x * 4 + 2] = static_cast<std::byte>(bgra[0]);
			dst[x * 4 + 3] = static_cast<std::byte>(bgra[3]);
		}
	}
}
} // namespace

struct FreetypeFace::SizeGuard {
	FreetypeFace const& face;

	~SizeGuard() { static_cast<void>(face.set_size(face.m_metrics.point_size)); }
};

FreetypeFace::FreetypeFace(Lib lib, FT_Face face, ByteArray bytes, float const point_size)
	: m_lib(std::move(lib)), m_face(face), m_bytes(std::move(bytes)) {
	m_metrics = make_metrics(point_size);
}

FreetypeFace::~FreetypeFace() { FT_Done_Face(m_face); }

std::optional<float> FreetypeFace::set_size(float const point_size) const {
	if (FT_Set_Char_Size(m_face, 0, to_26_6(point_size), 72, 72) == FT_Err_Ok) { return 1.0f; }
	if (m_face->num_fixed_sizes <= 0) { return {}; }

	// bitmap-only faces (eg colour emoji) only offer fixed strikes: at 72 dpi ppem == points
	auto const requested = to_26_6(point_size);
	auto nearest = FT_Int{};
	for (FT_Int i = 1; i < m_face->num_fixed_sizes; ++i) {
		auto const distance = std::abs(m_face->available_sizes[i].y_ppem - requested);
		if (distance < std::abs(m_face->available_sizes[nearest].y_ppem - requested)) { nearest = i; }
	}
	auto const strike = m_face->available_sizes[nearest].y_ppem;
	if (strike <= 0 || FT_Select_Size(m_face, nearest) != FT_Err_Ok) { return {}; }
	return static_cast<float>(requested) / static_cast<float>(strike);
}

Metrics FreetypeFace::make_metrics(float const point_size) {
	auto ret = Metrics{.units_per_em = m_face->units_per_em, .point_size = point_size};
	auto const ratio = set_size(point_size);
	if (!ratio) {
		m_logger.warn("failed to set size [{}pt] for [{}]", point_size, m_face->family_name ? m_face->family_name : "(unnamed)");
		return ret;
	}
	m_size_ratio = *ratio;
	auto const& size_metrics = m_face->size->metrics;
	ret.ascender = from_26_6(size_metrics.ascender) * m_size_ratio;
	ret.descender = -from_26_6(size_metrics.descender) * m_size_ratio;
	ret.line_gap = std::max(from_26_6(size_metrics.height) * m_size_ratio - ret.ascender - ret.descender, 0.0f);
	ret.line_height = ret.ascender + ret.descender + ret.line_gap;
	ret.monospace = FT_IS_FIXED_WIDTH(m_face);

	auto const units_to_points = ret.units_per_em > 0 ? point_size / static_cast<float>(ret.units_per_em) : 0.0f;
	ret.underline_position = static_cast<float>(m_face->underline_position) * units_to_points;
	ret.underline_thickness = static_cast<float>(m_face->underline_thickness) * units_to_points;

	auto const* os2 = static_cast<TT_OS2 const*>(FT_Get_Sfnt_Table(m_face, FT_SFNT_OS2));
	if (os2 && os2->version >= 2 && os2->sCapHeight > 0) {
		ret.cap_height = static_cast<float>(os2->sCapHeight) * units_to_points;
		ret.x_height = static_cast<float>(os2->sxHeight) * units_to_points;
	} else {
		ret.cap_height = codepoint_metrics(Codepoint{'H'}).extent.y;
		ret.x_height = codepoint_metrics(Codepoint{'x'}).extent.y;
	}

	ret.cell_width = std::max(codepoint_metrics(Codepoint{'M'}).advance.x, codepoint_metrics(Codepoint{'0'}).advance.x);
	return ret;
}

GlyphId FreetypeFace::glyph_index(Codepoint const codepoint) const {
	auto const index = FT_Get_Char_Index(m_face, static_cast<FT_ULong>(codepoint));
	if (index > 0xffff) { return GlyphId::eMissing; }
	return static_cast<GlyphId>(index);
}

GlyphMetrics FreetypeFace::glyph_metrics(GlyphId const glyph_id) const {
	auto ret = GlyphMetrics{.glyph_id = glyph_id};
	if (glyph_id == GlyphId::eMissing) { return ret; }
	if (FT_Load_Glyph(m_face, static_cast<FT_UInt>(glyph_id), FT_LOAD_NO_HINTING) != FT_Err_Ok) { return ret; }
	auto const& glyph = *m_face->glyph;
	ret.advance = glm::vec2{from_26_6(glyph.advance.x), from_26_6(glyph.advance.y)} * m_size_ratio;
	ret.bearing = glm::vec2{from_26_6(glyph.metrics.horiBearingX), from_26_6(glyph.metrics.horiBearingY)} * m_size_ratio;
	ret.extent = glm::vec2{from_26_6(glyph.metrics.width), from_26_6(glyph.metrics.height)} * m_size_ratio;
	return ret;
}

RasterizedGlyph FreetypeFace::render_glyph(GlyphId const glyph_id, float const scale, std::span<std::byte> buffer, std::uint32_t const capacity_edge) {
	assert(scale > 0.0f);
	assert(buffer.size() >= buffer_size_for(capacity_edge));

	auto const guard = SizeGuard{*this};
	auto const ratio = set_size(m_metrics.point_size * scale);
	if (!ratio) {
		throw RasterizationError{fmt::format("failed to set size [{}pt] for glyph [{}]", m_metrics.point_size * scale, static_cast<int>(glyph_id))};
	}
	// physical pixels per logical unit: a fixed strike may be larger or smaller than requested
	auto const pixel_scale = scale / *ratio;
	auto flags = FT_Int32{FT_LOAD_RENDER};
	if (FT_HAS_COLOR(m_face)) { flags |= FT_LOAD_COLOR; }
	if (FT_Load_Glyph(m_face, static_cast<FT_UInt>(glyph_id), flags) != FT_Err_Ok) {
		throw RasterizationError{fmt::format("failed to render glyph [{}]", static_cast<int>(glyph_id))};
	}

	auto const& slot = *m_face->glyph;
	auto const& bitmap = slot.bitmap;
	auto ret = RasterizedGlyph{
		.bearing = {static_cast<float>(slot.bitmap_left) / pixel_scale, static_cast<float>(slot.bitmap_top) / pixel_scale},
		.advance_x = from_26_6(slot.advance.x) / pixel_scale,
		.scale = pixel_scale,
	};
	if (bitmap.width == 0 || bitmap.rows == 0) { return ret; }

	auto const extent = Extent2D{std::min(bitmap.width, capacity_edge), std::min(bitmap.rows, capacity_edge)};
	if (extent.x < bitmap.width || extent.y < bitmap.rows) {
		m_logger.warn("glyph [{}] clamped from [{}x{}] to [{}x{}]", static_cast<int>(glyph_id), bitmap.width, bitmap.rows, extent.x, extent.y);
	}

	switch (bitmap.pixel_mode) {
	case FT_PIXEL_MODE_GRAY: copy_gray(bitmap, buffer, extent); break;
	case FT_PIXEL_MODE_MONO: copy_mono(bitmap, buffer, extent); break;
	case FT_PIXEL_MODE_BGRA:
		copy_bgra(bitmap, buffer, extent);
		ret.colour = true;
		break;
	default: throw RasterizationError{fmt::format("unsupported pixel mode [{}] for glyph [{}]", static_cast<int>(bitmap.pixel_mode), static_cast<int>(glyph_id))};
	}

	ret.extent = extent;
	ret.logical_height = static_cast<float>(extent.y) / pixel_scale;
	return ret;
}

Freetype::Freetype() {
	auto lib = FT_Library{};
	if (FT_Init_FreeType(&lib) != FT_Err_Ok) { throw InitError{"failed to initialize freetype"}; }
	m_lib = FreetypeFace::Lib{lib, [](FT_Library ptr) { FT_Done_FreeType(ptr); }};
}

std::unique_ptr<FontFace> Freetype::load(ByteArray bytes, float const point_size) const {
	assert(point_size > 0.0f);
	if (bytes.empty()) { throw FontNotFound{"empty font data"}; }
	auto face = FT_Face{};
	if (FT_New_Memory_Face(m_lib.get(), reinterpret_cast<FT_Byte const*>(bytes.data()), static_cast<FT_Long>(bytes.size()), 0, &face) != FT_Err_Ok) {
		throw FontNotFound{"failed to parse font data"};
	}
	return std::make_unique<FreetypeFace>(m_lib, face, std::move(bytes), point_size);
}
} // namespace glint
