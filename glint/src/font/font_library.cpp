#include <fmt/format.h>
#include <glint/font/font_library.hpp>
#include <glint/util/error.hpp>
#include <filesystem>
#include <fstream>

#if defined(GLINT_USE_FREETYPE)
#include <font/freetype/library.hpp>
#endif

namespace glint {
namespace fs = std::filesystem;

namespace {
ByteArray read_bytes(fs::path const& path) {
	auto file = std::ifstream{path, std::ios::binary | std::ios::ate};
	if (!file) { return {}; }
	auto const size = file.tellg();
	if (size <= 0) { return {}; }
	file.seekg(0, std::ios::beg);
	auto ret = ByteArray{static_cast<std::size_t>(size)};
	if (!file.read(reinterpret_cast<char*>(ret.data()), static_cast<std::streamsize>(size))) { return {}; }
	return ret;
}
} // namespace

std::unique_ptr<FontFace> FontLibrary::load_file(std::string_view const path, float const point_size) const {
	if (path.empty()) { throw InvalidFontName{"empty font path"}; }
	auto bytes = read_bytes(fs::path{path});
	if (bytes.empty()) { throw FontNotFound{fmt::format("failed to read font [{}]", path)}; }
	return load(std::move(bytes), point_size);
}

std::unique_ptr<FontLibrary> make_font_library() {
#if defined(GLINT_USE_FREETYPE)
	return std::make_unique<Freetype>();
#else
	return std::make_unique<FontLibrary::Null>();
#endif
}
} // namespace glint
