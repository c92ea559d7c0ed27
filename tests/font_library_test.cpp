#include <glint/defines.hpp>
#include <glint/font/font_library.hpp>
#include <glint/util/error.hpp>
#include <test/test.hpp>
#include <array>
#include <filesystem>
#include <fstream>
#include <memory>

namespace {
using namespace glint;
namespace fs = std::filesystem;

constexpr auto dejavu_paths_v = std::array{
	"/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
	"/usr/share/fonts/TTF/DejaVuSans.ttf",
	"/usr/share/fonts/dejavu/DejaVuSans.ttf",
};

constexpr auto emoji_paths_v = std::array{
	"/usr/share/fonts/truetype/noto/NotoColorEmoji.ttf",
	"/usr/share/fonts/noto/NotoColorEmoji.ttf",
	"/usr/share/fonts/google-noto-emoji/NotoColorEmoji.ttf",
};

template <std::size_t Size>
char const* find_font(std::array<char const*, Size> const& candidates) {
	for (auto const* candidate : candidates) {
		if (fs::exists(candidate)) { return candidate; }
	}
	return nullptr;
}

ADD_TEST(FontLibraryRejectsEmptyPath) {
	auto const library = make_font_library();
	ASSERT(library != nullptr);
	EXPECT_THROW(library->load_file("", 16.0f), InvalidFontName);
	EXPECT_THROW(library->load_file("glint/does/not/exist.ttf", 16.0f), FontNotFound);
}

ADD_TEST(FontLibraryRejectsGarbage) {
	if constexpr (!freetype_v) { return; }
	auto const library = make_font_library();
	auto bytes = ByteArray{64};
	bytes.fill(std::byte{0x5a});
	EXPECT_THROW(library->load(std::move(bytes), 16.0f), FontNotFound);
}

ADD_TEST(FontLibraryNull) {
	auto const library = FontLibrary::Null{};
	auto const face = library.load(ByteArray{}, 12.0f);
	ASSERT(face != nullptr);
	EXPECT(face->metrics().point_size == 12.0f);
	EXPECT(face->glyph_index(Codepoint{'A'}) == GlyphId::eMissing);

	auto buffer = std::array<std::byte, FontFace::buffer_size_for(4)>{};
	auto const glyph = face->render_glyph(GlyphId::eMissing, 2.0f, buffer, 4);
	EXPECT(glyph.extent == Extent2D{});
	EXPECT(glyph.scale == 2.0f);

	auto const other = library.load(ByteArray{}, 12.0f);
	EXPECT(face->id() != other->id());
}

ADD_TEST(FontLibraryLoadsSystemFont) {
	if constexpr (!freetype_v) { return; }
	auto const* path = find_font(dejavu_paths_v);
	if (path == nullptr) { return; }

	auto const library = make_font_library();
	auto const face = library->load_file(path, 16.0f);
	ASSERT(face != nullptr);
	auto const& metrics = face->metrics();
	EXPECT(metrics.point_size == 16.0f);
	EXPECT(metrics.ascender > 0.0f && metrics.descender > 0.0f);
	EXPECT(metrics.line_height >= metrics.ascender + metrics.descender - 1.0f);
	EXPECT(metrics.cap_height > metrics.x_height && metrics.x_height > 0.0f);
	EXPECT(!metrics.monospace);

	auto const a = face->glyph_index(Codepoint{'A'});
	EXPECT(a != GlyphId::eMissing);
	EXPECT(face->glyph_metrics(a).advance.x > 0.0f);

	static constexpr std::uint32_t edge_v{64};
	auto buffer = ByteArray{FontFace::buffer_size_for(edge_v)};
	auto const glyph = face->render_glyph(a, 2.0f, buffer.span(), edge_v);
	EXPECT(glyph.extent.x > 0u && glyph.extent.y > 0u);
	EXPECT(!glyph.colour);
	EXPECT(glyph.scale == 2.0f);
	EXPECT(glyph.logical_height > 0.0f && glyph.logical_height <= 16.0f);

	auto const space = face->render_glyph(face->glyph_index(Codepoint::eSpace), 1.0f, buffer.span(), edge_v);
	EXPECT(space.extent == Extent2D{});
	EXPECT(space.advance_x > 0.0f);
}
ADD_TEST(FontLibraryFaceOutlivesLibrary) {
	if constexpr (!freetype_v) { return; }
	auto const* path = find_font(dejavu_paths_v);
	if (path == nullptr) { return; }

	auto face = std::unique_ptr<FontFace>{};
	{
		auto const library = make_font_library();
		face = library->load_file(path, 16.0f);
	}
	ASSERT(face != nullptr);

	static constexpr std::uint32_t edge_v{64};
	auto buffer = ByteArray{FontFace::buffer_size_for(edge_v)};
	auto const glyph = face->render_glyph(face->glyph_index(Codepoint{'g'}), 1.0f, buffer.span(), edge_v);
	EXPECT(glyph.extent.x > 0u && glyph.extent.y > 0u);
	face.reset();
}

ADD_TEST(FontLibraryColourStrikeScaled) {
	if constexpr (!freetype_v) { return; }
	auto const* path = find_font(emoji_paths_v);
	if (path == nullptr) { return; }

	static constexpr float point_size_v{16.0f};
	auto const library = make_font_library();
	auto const face = library->load_file(path, point_size_v);
	// metrics describe the requested size, not the fixed strike
	EXPECT(face->metrics().line_height > 0.0f && face->metrics().line_height < point_size_v * 2.0f);

	auto const glyph_id = face->glyph_index(static_cast<Codepoint>(0x1f600));
	ASSERT(glyph_id != GlyphId::eMissing);
	EXPECT(face->glyph_metrics(glyph_id).advance.x < point_size_v * 2.0f);

	static constexpr std::uint32_t edge_v{256};
	auto buffer = ByteArray{FontFace::buffer_size_for(edge_v)};
	auto const glyph = face->render_glyph(glyph_id, 1.0f, buffer.span(), edge_v);
	EXPECT(glyph.colour);
	ASSERT(glyph.extent.y > 0u);
	EXPECT(glyph.logical_height > 0.0f && glyph.logical_height < point_size_v * 2.0f);
	EXPECT(glyph.advance_x < point_size_v * 2.0f);
	EXPECT(glyph.scale > 0.0f);
	EXPECT(static_cast<float>(glyph.extent.y) / glyph.scale == glyph.logical_height);
}
} // namespace
