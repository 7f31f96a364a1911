#include <glm/gtc/matrix_transform.hpp>
#include <tilecam/projection.hpp>
#include <cmath>

namespace tilecam {
namespace {
struct Span {
	glm::vec2 extent{};
	glm::vec2 pixels_per_unit{};
	// world size of one tile
	glm::vec2 tile{1.0f};
};

Span make_span(FitResult const& fit, WorldSpace const world_space) {
	auto const scale = static_cast<float>(fit.scale);
	switch (world_space) {
	case WorldSpace::ePixels:
		return {.extent = glm::vec2{fit.viewport_size} / scale, .pixels_per_unit = glm::vec2{scale}, .tile = glm::vec2{fit.pixels_per_tile}};
	case WorldSpace::eUnits:
	default: return {.extent = glm::vec2{fit.tile_count}, .pixels_per_unit = glm::vec2{fit.pixels_per_tile} * scale};
	}
}

// Splits on a tile boundary: an odd tile count puts its extra tile on the positive side.
float centred_min(float const span, float const tile) { return -std::floor(0.5f * span / tile) * tile; }
} // namespace

glm::mat4 ProjectionResult::matrix() const { return glm::ortho(left, right, bottom, top, near, far); }

ProjectionResult project(FitResult const& fit, WorldSpace const world_space, DepthRange const depth_range) {
	auto const span = make_span(fit, world_space);
	auto ret = ProjectionResult{.near = depth_range.near, .far = depth_range.far, .pixels_per_unit = span.pixels_per_unit};
	if (fit.centered) {
		ret.left = centred_min(span.extent.x, span.tile.x);
		ret.bottom = centred_min(span.extent.y, span.tile.y);
	} else {
		ret.left = ret.bottom = 0.0f;
	}
	ret.right = ret.left + span.extent.x;
	ret.top = ret.bottom + span.extent.y;
	return ret;
}

ProjectionResult project(FitResult const& fit, GridConfig const& config) { return project(fit, config.world_space(), config.depth_range()); }
} // namespace tilecam
