#pragma once
#include <stdexcept>

namespace tilecam {
///
/// \brief Base tilecam exception.
///
struct Error : std::runtime_error {
	using std::runtime_error::runtime_error;
};

///
/// \brief GridConfig with a tile count or pixels-per-tile component below 1.
///
struct InvalidGridConfig : Error {
	using Error::Error;
};

///
/// \brief Window size with a component that is zero or negative.
///
/// Transient: callers should skip the re-fit and keep their last valid result.
///
struct InvalidWindowSize : Error {
	using Error::Error;
};
} // namespace tilecam
