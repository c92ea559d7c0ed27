#include <glint/atlas.hpp>
#include <glm/common.hpp>
#include <algorithm>
#include <cassert>
#include <cstring>

namespace glint {
namespace {
constexpr std::size_t byte_count(Extent2D const extent, std::uint32_t const channels) { return static_cast<std::size_t>(extent.x) * extent.y * channels; }

constexpr Extent2D next_extent(Extent2D const current, Extent2D const max) {
	auto ret = current;
	// double the smaller side first so the store stays roughly square
	if (ret.x <= ret.y && ret.x < max.x) {
		ret.x = std::min(ret.x * 2, max.x);
	} else if (ret.y < max.y) {
		ret.y = std::min(ret.y * 2, max.y);
	} else if (ret.x < max.x) {
		ret.x = std::min(ret.x * 2, max.x);
	}
	return ret;
}
} // namespace

UvRect Region::uv(Extent2D const atlas_extent) const {
	if (atlas_extent.x == 0 || atlas_extent.y == 0 || x > atlas_extent.x || y > atlas_extent.y) { return {}; }
	glm::vec2 const image_extent = atlas_extent;
	auto const top_left = glm::vec2{static_cast<float>(x), static_cast<float>(y)};
	auto const cell_extent = glm::vec2{static_cast<float>(width), static_cast<float>(height)};
	return UvRect{.lt = top_left / image_extent, .rb = (top_left + cell_extent) / image_extent};
}

Atlas::Atlas(PixelFormat const format, CreateInfo const& create_info)
	: m_extent(create_info.initial_extent), m_max_extent(glm::max(create_info.max_extent, create_info.initial_extent)), m_padding(create_info.padding),
	  m_format(format) {
	assert(m_extent.x > 0 && m_extent.y > 0);
	m_pixels = ByteArray{byte_count(m_extent, channels())};
	reset_cursor();
}

std::optional<Region> Atlas::reserve(Extent2D const extent) {
	assert(extent.x > 0 && extent.y > 0);
	auto cursor = m_cursor;
	auto shelf_height = m_shelf_height;
	if (cursor.x > m_padding.x && cursor.x + extent.x + m_padding.x > m_extent.x) {
		cursor = {m_padding.x, cursor.y + shelf_height + m_padding.y}; // new shelf
		shelf_height = 0;
	}
	if (cursor.x + extent.x + m_padding.x > m_extent.x) { return {}; }
	if (cursor.y + extent.y + m_padding.y > m_extent.y) { return {}; }

	auto const ret = Region{.x = cursor.x, .y = cursor.y, .width = extent.x, .height = extent.y};
	m_cursor = {cursor.x + extent.x + m_padding.x, cursor.y};
	m_shelf_height = std::max(shelf_height, extent.y);
	return ret;
}

void Atlas::set(Region const& region, std::span<std::byte const> pixels) {
	assert(!region.is_empty());
	assert(region.x + region.width <= m_extent.x && region.y + region.height <= m_extent.y);
	auto const row_bytes = static_cast<std::size_t>(region.width) * channels();
	assert(pixels.size() == row_bytes * region.height);
	auto const stride = static_cast<std::size_t>(m_extent.x) * channels();
	auto* dst = m_pixels.data() + static_cast<std::size_t>(region.y) * stride + static_cast<std::size_t>(region.x) * channels();
	for (std::uint32_t row = 0; row < region.height; ++row) {
		std::memcpy(dst + row * stride, pixels.data() + row * row_bytes, row_bytes);
	}
	++m_generation;
}

void Atlas::clear() {
	reset_cursor();
	++m_generation;
}

bool Atlas::grow() {
	auto const extent = next_extent(m_extent, m_max_extent);
	if (extent == m_extent) {
		m_logger.warn("cannot grow beyond [{}x{}]", m_max_extent.x, m_max_extent.y);
		return false;
	}
	m_logger.info("growing [{}x{}] => [{}x{}]", m_extent.x, m_extent.y, extent.x, extent.y);
	// TODO: copy surviving pixels into the new store once entries can outlive growth
	m_pixels = ByteArray{byte_count(extent, channels())};
	m_extent = extent;
	reset_cursor();
	++m_generation;
	return true;
}

void Atlas::reset_cursor() {
	m_cursor = m_padding;
	m_shelf_height = {};
}
} // namespace glint
