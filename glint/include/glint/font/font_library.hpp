#pragma once
#include <glint/font/font_face.hpp>
#include <glint/util/dyn_array.hpp>
#include <memory>
#include <string_view>

namespace glint {
///
/// \brief Font loading backend: produces FontFaces from font file bytes.
///
struct FontLibrary {
	struct Null;

	virtual ~FontLibrary() = default;

	///
	/// \brief Load a face from in-memory font data.
	/// \param bytes Font file contents (ownership is transferred to the face)
	/// \param point_size Size to compute metrics / rasterize at (scale 1)
	///
	/// Throws FontNotFound if the bytes cannot be parsed.
	///
	virtual std::unique_ptr<FontFace> load(ByteArray bytes, float point_size) const = 0;

	///
	/// \brief Read a font file and load a face from it.
	///
	/// Throws InvalidFontName on an empty path, FontNotFound if the file cannot be read or parsed.
	///
	std::unique_ptr<FontFace> load_file(std::string_view path, float point_size) const;
};

struct FontLibrary::Null : FontLibrary {
	std::unique_ptr<FontFace> load(ByteArray, float point_size) const final { return std::make_unique<FontFace::Null>(point_size); }
};

///
/// \brief Create the font library selected at build time (FreeType if GLINT_USE_FREETYPE, else Null).
///
std::unique_ptr<FontLibrary> make_font_library();
} // namespace glint
