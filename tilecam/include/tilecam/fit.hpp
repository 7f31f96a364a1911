#pragma once
#include <tilecam/grid_config.hpp>
#include <tilecam/rect.hpp>

namespace tilecam {
///
/// \brief Integer scale and viewport placement of a target image inside a window.
///
struct FitResult {
	///
	/// \brief Window size this result was fitted against.
	///
	WindowSize window{};
	Extent2D tile_count{1u, 1u};
	Extent2D pixels_per_tile{8u, 8u};
	bool centered{true};

	///
	/// \brief Physical pixels per logical pixel, always >= 1.
	///
	int scale{1};
	///
	/// \brief Top-left corner of the viewport relative to the window's top-left corner.
	///
	/// Negative when the viewport is larger than the window and centered.
	///
	glm::ivec2 viewport_origin{};
	glm::ivec2 viewport_size{};
	///
	/// \brief Whether the scale was raised to 1 because the window is smaller than the target on an axis.
	///
	bool clamped{};

	glm::ivec2 target_resolution() const { return glm::ivec2{tile_count * pixels_per_tile}; }

	PixelRect viewport() const { return PixelRect::from_origin_extent(viewport_origin, viewport_size); }
	///
	/// \brief Portion of the viewport inside the window; callers clip presentation to this.
	///
	PixelRect visible_rect() const { return viewport().intersect(PixelRect{.rb = window}); }
	///
	/// \brief Whether the viewport extends past the window on either axis.
	///
	bool exceeds_window() const;

	bool operator==(FitResult const&) const = default;
};

///
/// \brief Compute the largest integer scale at which the target image fits the window.
///
/// scale = max(1, min(window.x / target.x, window.y / target.y)), target = tile_count * pixels_per_tile.
/// The target is never minified: a window smaller than the target yields scale 1 and a viewport that overflows it.
///
/// \param window Window size in physical pixels
/// \param config Grid configuration
/// \returns The fitted scale and viewport
/// \throws InvalidWindowSize if either window component is <= 0
///
FitResult fit(WindowSize window, GridConfig const& config);
///
/// \brief Convenience overload that validates the grid parameters first.
/// \throws InvalidGridConfig if tile_count or pixels_per_tile has a 0 component
/// \throws InvalidWindowSize if either window component is <= 0
///
FitResult fit(WindowSize window, Extent2D tile_count, Extent2D pixels_per_tile, bool centered = true);
} // namespace tilecam
