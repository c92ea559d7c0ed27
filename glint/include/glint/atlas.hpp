#pragma once
#include <glint/rect.hpp>
#include <glint/util/dyn_array.hpp>
#include <glint/util/logger.hpp>
#include <cstdint>
#include <optional>

namespace glint {
class GlyphCache;

enum class PixelFormat : std::uint8_t { eGrayscale, eRgba };

constexpr std::uint32_t channels_for(PixelFormat const format) { return format == PixelFormat::eRgba ? 4u : 1u; }

///
/// \brief Rectangle inside an Atlas's backing store (pixels, +y down).
///
/// A 0x0 Region carries no reservation and is never written.
///
struct Region {
	std::uint32_t x{};
	std::uint32_t y{};
	std::uint32_t width{};
	std::uint32_t height{};

	constexpr bool is_empty() const { return width == 0 || height == 0; }
	constexpr Extent2D extent() const { return {width, height}; }

	constexpr bool overlaps(Region const& rhs) const {
		if (is_empty() || rhs.is_empty()) { return false; }
		return x < rhs.x + rhs.width && rhs.x < x + width && y < rhs.y + rhs.height && rhs.y < y + height;
	}

	///
	/// \brief Convert to normalized texture coordinates for an atlas of the given extent.
	///
	UvRect uv(Extent2D atlas_extent) const;

	bool operator==(Region const&) const = default;
};

struct AtlasCreateInfo {
	static constexpr auto extent_v = Extent2D{512u, 512u};
	static constexpr auto max_extent_v = Extent2D{4096u, 4096u};
	static constexpr auto padding_v = Extent2D{1u, 1u};

	Extent2D initial_extent{extent_v};
	Extent2D max_extent{max_extent_v};
	Extent2D padding{padding_v};
};

///
/// \brief Growable CPU-side bitmap that packs rectangles on horizontal shelves.
///
/// generation() is bumped on every content change (writes, clears, growth): a renderer
/// re-uploads the pixels to the GPU whenever it differs from the last observed value.
///
/// Growth discards all pixels and reservations, and is only reachable through GlyphCache,
/// which clears every entry referencing the atlas in the same step.
///
class Atlas {
  public:
	using CreateInfo = AtlasCreateInfo;

	explicit Atlas(PixelFormat format, CreateInfo const& create_info = {});

	///
	/// \brief Reserve space for a block of pixels.
	/// \param extent Non-zero extent of the block
	/// \returns Region if there was space, else nullopt
	///
	std::optional<Region> reserve(Extent2D extent);
	///
	/// \brief Copy a tightly packed block of pixels into region.
	/// \param region Reserved, non-empty Region
	/// \param pixels region.width * region.height * channels bytes
	///
	void set(Region const& region, std::span<std::byte const> pixels);
	///
	/// \brief Reset packing state (does not zero memory).
	///
	void clear();

	PixelFormat format() const { return m_format; }
	std::uint32_t channels() const { return channels_for(m_format); }
	Extent2D size() const { return m_extent; }
	std::uint32_t generation() const { return m_generation; }
	std::span<std::byte const> pixels() const { return m_pixels.span(); }

	UvRect uv_rect_for(Region const& region) const { return region.uv(m_extent); }

  private:
	///
	/// \brief Enlarge the backing store (area roughly doubles, capped at max_extent).
	/// \returns false if already at max_extent
	///
	bool grow();

	void reset_cursor();

	ByteArray m_pixels{};
	Extent2D m_extent{};
	Extent2D m_max_extent{};
	Extent2D m_padding{};
	Extent2D m_cursor{};
	std::uint32_t m_shelf_height{};
	std::uint32_t m_generation{};
	PixelFormat m_format{};
	Logger m_logger{"Atlas"};

	friend class GlyphCache;
};
} // namespace glint
