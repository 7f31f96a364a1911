#pragma once
#include <glm/vec2.hpp>
#include <cstdint>
#include <string_view>

namespace tilecam {
///
/// \brief Unsigned 2D extent: tile counts, pixels per tile, resolutions.
///
using Extent2D = glm::uvec2;
///
/// \brief Window size in physical pixels.
///
/// Signed so that non-positive sizes reported by a windowing layer can be detected and rejected.
///
using WindowSize = glm::ivec2;

///
/// \brief World-space convention of the projection.
///
enum class WorldSpace : std::uint8_t {
	///
	/// \brief One world unit is one tile.
	///
	eUnits,
	///
	/// \brief One world unit is one physical pixel at scale 1.
	///
	ePixels,
};

///
/// \brief Near / far planes passed through to the projection.
///
struct DepthRange {
	float near{0.0f};
	float far{1000.0f};

	bool operator==(DepthRange const&) const = default;
};

struct GridCreateInfo {
	Extent2D tile_count{1u, 1u};
	Extent2D pixels_per_tile{8u, 8u};
	WorldSpace world_space{WorldSpace::eUnits};
	DepthRange depth_range{};
	bool centered{true};

	bool operator==(GridCreateInfo const&) const = default;
};

///
/// \brief Validated, immutable description of the tile grid to display.
///
/// Construction throws InvalidGridConfig if any tile count or pixels-per-tile component is 0,
/// or if the target resolution does not fit in a signed 32-bit pixel coordinate.
///
class GridConfig {
  public:
	using CreateInfo = GridCreateInfo;

	GridConfig() : GridConfig(CreateInfo{}) {}
	explicit GridConfig(CreateInfo const& create_info);

	///
	/// \brief Build a config whose tile count covers the given resolution.
	/// \param pixels_per_tile Pixels per tile
	/// \param resolution Desired target resolution in pixels; truncated to whole tiles
	/// \param base Remaining settings (tile_count and pixels_per_tile are overwritten)
	///
	static GridConfig from_target_resolution(Extent2D pixels_per_tile, Extent2D resolution, CreateInfo base = {});
	///
	/// \brief Build a config that uses pixels as world units.
	///
	static GridConfig pixel_cam(Extent2D tile_count, Extent2D pixels_per_tile = {8u, 8u});

	Extent2D tile_count() const { return m_info.tile_count; }
	Extent2D pixels_per_tile() const { return m_info.pixels_per_tile; }
	WorldSpace world_space() const { return m_info.world_space; }
	DepthRange depth_range() const { return m_info.depth_range; }
	bool centered() const { return m_info.centered; }
	CreateInfo const& info() const { return m_info; }

	///
	/// \brief Unscaled size of the target image in pixels (tile_count * pixels_per_tile).
	///
	Extent2D target_resolution() const { return m_info.tile_count * m_info.pixels_per_tile; }

	bool operator==(GridConfig const&) const = default;

  private:
	CreateInfo m_info{};
};

constexpr std::string_view to_string(WorldSpace const world_space) {
	switch (world_space) {
	case WorldSpace::eUnits: return "units";
	case WorldSpace::ePixels: return "pixels";
	default: return "unknown";
	}
}
} // namespace tilecam
