#include <glm/common.hpp>
#include <tilecam/tile_grid.hpp>

namespace tilecam {
TileGrid TileGrid::make(GridConfig const& config) {
	if (config.world_space() == WorldSpace::ePixels) { return {.tile_size = glm::vec2{config.pixels_per_tile()}}; }
	return {};
}

glm::ivec2 TileGrid::world_to_tile(glm::vec2 const world) const { return glm::ivec2{glm::floor(world / tile_size)}; }

glm::vec2 snap_to_pixel(glm::vec2 const world, glm::vec2 const pixels_per_unit) { return glm::round(world * pixels_per_unit) / pixels_per_unit; }
} // namespace tilecam
