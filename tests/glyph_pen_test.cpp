#include <fake_face.hpp>
#include <glint/glyph_pen.hpp>
#include <test/test.hpp>
#include <string_view>
#include <vector>

namespace {
using namespace glint;
using glint::testing::FakeFace;

std::vector<ShapedGlyph> shape(FontFace const& face, std::string_view const text) {
	auto ret = std::vector<ShapedGlyph>{};
	for (std::uint32_t i = 0; i < text.size(); ++i) {
		auto const glyph_id = face.glyph_index(static_cast<Codepoint>(static_cast<unsigned char>(text[i])));
		ret.push_back({.glyph_id = glyph_id, .x_advance = face.glyph_metrics(glyph_id).advance.x, .cluster = i});
	}
	return ret;
}

struct WarningCounter : Logger::Sink {
	void on_log(Logger::Entry const& entry) final {
		if (entry.level == Logger::Level::eWarn) { ++warnings; }
	}

	int warnings{};
};

ADD_TEST(GlyphPenPlacesQuads) {
	auto face = FakeFace{16.0f};
	auto cache = GlyphCache{1.0f};
	auto pen = GlyphPen{&cache, &face, {10.0f, 20.0f}};

	auto const quads = pen.write(shape(face, "AB"));
	ASSERT(quads.size() == 2u);
	// 8x12 glyphs sitting on the baseline, advancing by 9
	EXPECT((quads[0].rect == Rect2D<>{.lt = {10.0f, 8.0f}, .rb = {18.0f, 20.0f}}));
	EXPECT((quads[1].rect == Rect2D<>{.lt = {19.0f, 8.0f}, .rb = {27.0f, 20.0f}}));
	EXPECT(quads[0].cluster == 0u && quads[1].cluster == 1u);
	EXPECT(!quads[0].colour);
	EXPECT(quads[0].uv == cache.atlas().uv_rect_for(Region{1, 1, 8, 12}));
	EXPECT(pen.cursor == glm::vec2(28.0f, 20.0f));
}

ADD_TEST(GlyphPenOffsetsAndScale) {
	auto face = FakeFace{16.0f};
	auto cache = GlyphCache{2.0f};
	auto pen = GlyphPen{&cache, &face};

	auto const run = std::vector<ShapedGlyph>{{.glyph_id = static_cast<GlyphId>('A'), .x_offset = 1.0f, .y_offset = 2.0f, .x_advance = 9.0f}};
	auto const quads = pen.write(run);
	ASSERT(quads.size() == 1u);
	// physical 16x24 region, logical 8x12 quad; y_offset is +y up
	EXPECT(quads[0].rect.lt == glm::vec2(1.0f, -14.0f));
	EXPECT(quads[0].rect.extent() == glm::vec2(8.0f, 12.0f));
	EXPECT(quads[0].uv == cache.atlas().uv_rect_for(Region{1, 1, 16, 24}));
}

ADD_TEST(GlyphPenSkipsInklessGlyphs) {
	auto face = FakeFace{16.0f};
	auto cache = GlyphCache{1.0f};
	auto pen = GlyphPen{&cache, &face};

	auto const quads = pen.write(shape(face, "A B"));
	ASSERT(quads.size() == 2u);
	EXPECT(quads[1].cluster == 2u);
	EXPECT(quads[1].rect.lt.x == 18.0f);
	EXPECT(pen.cursor.x == 27.0f);
}

ADD_TEST(GlyphPenSkipsFailedGlyphs) {
	auto face = FakeFace{16.0f};
	face.failing_glyph = static_cast<GlyphId>('B');
	auto cache = GlyphCache{1.0f};
	auto pen = GlyphPen{&cache, &face};
	auto counter = WarningCounter{};
	Logger::attach(counter);

	auto const quads = pen.write(shape(face, "ABC"));
	ASSERT(quads.size() == 2u);
	EXPECT(quads[0].cluster == 0u && quads[1].cluster == 2u);
	EXPECT(quads[1].rect.lt.x == 18.0f);
	EXPECT(pen.cursor.x == 27.0f);
	EXPECT(counter.warnings == 1);
}

ADD_TEST(GlyphPenSubstitutesMissingGlyph) {
	auto face = FakeFace{16.0f};
	auto const huge = static_cast<GlyphId>('W');
	face.extents[huge] = {100.0f, 100.0f};
	auto cache = GlyphCache{1.0f, {.atlas = {.initial_extent = {32, 32}, .max_extent = {32, 32}}}};
	auto pen = GlyphPen{&cache, &face};

	auto const quads = pen.write(shape(face, "W"));
	ASSERT(quads.size() == 1u);
	EXPECT(cache.contains(face, GlyphId::eMissing));
	EXPECT(!cache.contains(face, huge));
	EXPECT(quads[0].rect.extent() == glm::vec2(8.0f, 12.0f));
	EXPECT(pen.cursor.x == 101.0f);
}

ADD_TEST(GlyphPenRebuildsAfterGrowth) {
	auto face = FakeFace{16.0f};
	auto const big = static_cast<GlyphId>('W');
	face.extents[big] = {40.0f, 20.0f};
	auto cache = GlyphCache{1.0f, {.atlas = {.initial_extent = {32, 32}, .max_extent = {64, 64}}}};
	auto pen = GlyphPen{&cache, &face};
	auto const epoch = cache.epoch();

	auto const quads = pen.write(shape(face, "aW"));
	EXPECT(cache.epoch() > epoch);
	EXPECT(cache.atlas().size() == Extent2D(64, 32));
	ASSERT(quads.size() == 2u);
	// every quad refers to a region packed after the growth: 'W' first, then 'a' re-rendered beside it
	EXPECT(cache.contains(face, static_cast<GlyphId>('a')) && cache.contains(face, big));
	EXPECT(quads[0].uv == cache.atlas().uv_rect_for(Region{42, 1, 8, 12}));
	EXPECT(quads[1].uv == cache.atlas().uv_rect_for(Region{1, 1, 40, 20}));
	EXPECT(pen.cursor.x == 50.0f);
}

ADD_TEST(GlyphPenMeasure) {
	auto face = FakeFace{16.0f};
	auto cache = GlyphCache{1.0f};
	auto const pen = GlyphPen{&cache, &face};
	auto const run = shape(face, "A B");

	auto const measurement = pen.measure(run);
	EXPECT(measurement.width == 27.0f);
	EXPECT(measurement.height == 16.0f);
	EXPECT(measurement.line_count == 1u);
	EXPECT(cache.size() == 0u);

	EXPECT(measure_run({}, face.metrics()).width == 0.0f);
}

ADD_TEST(GlyphPenFailedWriteKeepsCursor) {
	auto face = FakeFace{16.0f};
	face.extents[static_cast<GlyphId>('W')] = {100.0f, 100.0f};
	face.extents[GlyphId::eMissing] = {100.0f, 100.0f};
	auto cache = GlyphCache{1.0f, {.atlas = {.initial_extent = {32, 32}, .max_extent = {32, 32}}}};
	auto pen = GlyphPen{&cache, &face, {5.0f, 20.0f}};

	// neither 'W' nor its missing-glyph substitute fit
	EXPECT_THROW(pen.write(shape(face, "aW")), AtlasFull);
	EXPECT(pen.cursor == glm::vec2(5.0f, 20.0f));

	auto const quads = pen.write(shape(face, "a"));
	EXPECT(quads.size() == 1u);
	EXPECT(pen.cursor.x == 14.0f);
}
} // namespace
