#pragma once
#include <djson/json.hpp>
#include <glint/text_system.hpp>
#include <string_view>

namespace glint {
void from_json(dj::Json const& json, Extent2D& out, Extent2D const& fallback = {});
void to_json(dj::Json& out, Extent2D const& extent);

void from_json(dj::Json const& json, AtlasCreateInfo& out);
void to_json(dj::Json& out, AtlasCreateInfo const& create_info);

void from_json(dj::Json const& json, GlyphCacheCreateInfo& out);
void to_json(dj::Json& out, GlyphCacheCreateInfo const& create_info);

void from_json(dj::Json const& json, TextSystemCreateInfo& out);
void to_json(dj::Json& out, TextSystemCreateInfo const& create_info);

///
/// \brief Parse text system configuration from JSON text.
///
/// Missing keys keep their defaults. Throws ConfigError for unusable values (zero extents, non-positive scale).
///
TextSystemCreateInfo load_config(std::string_view json_text);
} // namespace glint
