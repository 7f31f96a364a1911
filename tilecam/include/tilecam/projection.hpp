#pragma once
#include <glm/mat4x4.hpp>
#include <tilecam/fit.hpp>

namespace tilecam {
///
/// \brief Orthographic frustum extents in world units.
///
struct ProjectionResult {
	float left{-1.0f};
	float right{1.0f};
	float bottom{-1.0f};
	float top{1.0f};
	float near{0.0f};
	float far{1000.0f};

	///
	/// \brief Physical pixels per world unit, per axis.
	///
	glm::vec2 pixels_per_unit{1.0f};

	glm::vec2 extent() const { return {right - left, top - bottom}; }
	glm::vec2 half_extent() const { return 0.5f * extent(); }

	///
	/// \brief Obtain the orthographic projection matrix (glm clip space conventions).
	///
	glm::mat4 matrix() const;

	bool operator==(ProjectionResult const&) const = default;
};

///
/// \brief Derive orthographic extents for a fitted viewport.
///
/// Spans tile_count world units in WorldSpace::eUnits, and viewport_size / scale world units in WorldSpace::ePixels.
/// Centered frusta split the span on a tile boundary: left = -floor(tiles / 2) * tile_size and right = left + span,
/// so an odd tile count puts its extra tile on the positive side and the world origin stays on a tile corner.
/// Anchored frusta span [0, span].
/// Near / far are taken verbatim from depth_range.
///
ProjectionResult project(FitResult const& fit, WorldSpace world_space, DepthRange depth_range);
///
/// \brief Convenience overload using config's world space and depth range.
///
ProjectionResult project(FitResult const& fit, GridConfig const& config);
} // namespace tilecam
