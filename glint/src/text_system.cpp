#include <glint/text_system.hpp>

namespace glint {
TextSystem::TextSystem(CreateInfo const& create_info) : m_face(std::make_unique<FontFace::Null>()), m_cache(create_info.scale, create_info.cache) {}

void TextSystem::load_font(std::unique_ptr<FontFace> face) {
	if (!face) {
		m_logger.warn("ignoring null font face");
		return;
	}
	m_face = std::move(face);
	m_loaded = true;
	m_cache.clear();
	m_logger.info("active font: [{}pt] line height [{}]", m_face->metrics().point_size, m_face->metrics().line_height);
}

void TextSystem::load_font(FontLibrary const& library, std::string_view const path, float const point_size) {
	auto face = library.load_file(path, point_size);
	m_logger.info("loaded font [{}]", path);
	load_font(std::move(face));
}
} // namespace glint
