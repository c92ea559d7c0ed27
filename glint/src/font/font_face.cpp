#include <glint/font/font_face.hpp>
#include <atomic>

namespace glint {
namespace {
std::atomic<FontFace::Id::id_type> g_next_id{1};
} // namespace

FontFace::FontFace() : m_id(g_next_id++) {}

FontFace::Null::Null(float const point_size) {
	m_metrics.point_size = point_size;
	m_metrics.line_height = point_size;
}
} // namespace glint
