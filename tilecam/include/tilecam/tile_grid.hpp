#pragma once
#include <glm/vec2.hpp>
#include <tilecam/grid_config.hpp>

namespace tilecam {
///
/// \brief Maps between world positions and integer tile coordinates.
///
/// Tile (0, 0) has its bottom-left corner at the world origin.
///
struct TileGrid {
	///
	/// \brief Size of one tile in world units: 1 in WorldSpace::eUnits, pixels_per_tile in WorldSpace::ePixels.
	///
	glm::vec2 tile_size{1.0f};

	static TileGrid make(GridConfig const& config);

	glm::ivec2 world_to_tile(glm::vec2 world) const;
	glm::vec2 tile_to_world(glm::ivec2 tile) const { return glm::vec2{tile} * tile_size; }
	glm::vec2 tile_centre(glm::ivec2 tile) const { return tile_to_world(tile) + 0.5f * tile_size; }
	///
	/// \brief Snap a world position to the bottom-left corner of the tile containing it.
	///
	glm::vec2 snap(glm::vec2 world) const { return tile_to_world(world_to_tile(world)); }
};

///
/// \brief Round a world position to the nearest physical pixel boundary.
/// \param world World position
/// \param pixels_per_unit Conversion factor from ProjectionResult
///
glm::vec2 snap_to_pixel(glm::vec2 world, glm::vec2 pixels_per_unit);
} // namespace tilecam
