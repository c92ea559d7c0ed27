#pragma once
#include <stdexcept>

namespace glint {
///
/// \brief Base glint exception.
///
struct Error : std::runtime_error {
	using std::runtime_error::runtime_error;
};

///
/// \brief Error during initialization (eg font library).
///
struct InitError : Error {
	using Error::Error;
};

///
/// \brief Font name / path was empty or malformed.
///
struct InvalidFontName : Error {
	using Error::Error;
};

///
/// \brief Font could not be found or parsed.
///
struct FontNotFound : Error {
	using Error::Error;
};

///
/// \brief Backend could not produce a drawing surface for a glyph.
///
/// Recoverable: substitute an empty glyph and continue the run.
///
struct RasterizationError : Error {
	using Error::Error;
};

///
/// \brief Atlas reservation failed even after growing once.
///
struct AtlasFull : Error {
	using Error::Error;
};

///
/// \brief Configuration contained invalid values.
///
struct ConfigError : Error {
	using Error::Error;
};
} // namespace glint
