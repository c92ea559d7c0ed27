#include <fmt/format.h>
#include <glint/io/config.hpp>
#include <glint/util/error.hpp>

namespace glint {
namespace {
void validate(Extent2D const extent, std::string_view const name) {
	if (extent.x == 0 || extent.y == 0) { throw ConfigError{fmt::format("invalid {}: [{}x{}]", name, extent.x, extent.y)}; }
}

void validate(TextSystemCreateInfo const& info) {
	validate(info.cache.atlas.initial_extent, "atlas.initial_extent");
	validate(info.cache.atlas.max_extent, "atlas.max_extent");
	if (info.cache.scratch_edge == 0) { throw ConfigError{"invalid cache.scratch_edge: 0"}; }
	if (!(info.scale > 0.0f)) { throw ConfigError{fmt::format("invalid scale: {}", info.scale)}; }
}
} // namespace

void from_json(dj::Json const& json, Extent2D& out, Extent2D const& fallback) {
	out.x = json[0].as<std::uint32_t>(fallback.x);
	out.y = json[1].as<std::uint32_t>(fallback.y);
}

void to_json(dj::Json& out, Extent2D const& extent) {
	out.push_back(extent.x);
	out.push_back(extent.y);
}

void from_json(dj::Json const& json, AtlasCreateInfo& out) {
	from_json(json["initial_extent"], out.initial_extent, AtlasCreateInfo::extent_v);
	from_json(json["max_extent"], out.max_extent, AtlasCreateInfo::max_extent_v);
	from_json(json["padding"], out.padding, AtlasCreateInfo::padding_v);
}

void to_json(dj::Json& out, AtlasCreateInfo const& create_info) {
	to_json(out["initial_extent"], create_info.initial_extent);
	to_json(out["max_extent"], create_info.max_extent);
	to_json(out["padding"], create_info.padding);
}

void from_json(dj::Json const& json, GlyphCacheCreateInfo& out) {
	from_json(json["atlas"], out.atlas);
	out.scratch_edge = json["scratch_edge"].as<std::uint32_t>(GlyphCacheCreateInfo::scratch_edge_v);
}

void to_json(dj::Json& out, GlyphCacheCreateInfo const& create_info) {
	to_json(out["atlas"], create_info.atlas);
	out["scratch_edge"] = create_info.scratch_edge;
}

void from_json(dj::Json const& json, TextSystemCreateInfo& out) {
	from_json(json["cache"], out.cache);
	out.scale = json["scale"].as<float>(1.0f);
}

void to_json(dj::Json& out, TextSystemCreateInfo const& create_info) {
	to_json(out["cache"], create_info.cache);
	out["scale"] = create_info.scale;
}

TextSystemCreateInfo load_config(std::string_view const json_text) {
	auto ret = TextSystemCreateInfo{};
	from_json(dj::Json::parse(json_text), ret);
	validate(ret);
	return ret;
}
} // namespace glint
