#include <fmt/format.h>
#include <tilecam/grid_config.hpp>
#include <tilecam/util/error.hpp>
#include <cstdint>
#include <limits>

namespace tilecam {
namespace {
constexpr auto max_resolution_v = static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max());

constexpr bool is_positive(Extent2D const extent) { return extent.x > 0u && extent.y > 0u; }

constexpr bool fits_pixel_space(Extent2D const tile_count, Extent2D const pixels_per_tile) {
	auto const x = std::uint64_t{tile_count.x} * std::uint64_t{pixels_per_tile.x};
	auto const y = std::uint64_t{tile_count.y} * std::uint64_t{pixels_per_tile.y};
	return x <= max_resolution_v && y <= max_resolution_v;
}
} // namespace

GridConfig::GridConfig(CreateInfo const& create_info) : m_info(create_info) {
	if (!is_positive(m_info.tile_count)) {
		throw InvalidGridConfig{fmt::format("invalid tile_count [{}x{}]: components must be >= 1", m_info.tile_count.x, m_info.tile_count.y)};
	}
	if (!is_positive(m_info.pixels_per_tile)) {
		throw InvalidGridConfig{
			fmt::format("invalid pixels_per_tile [{}x{}]: components must be >= 1", m_info.pixels_per_tile.x, m_info.pixels_per_tile.y)};
	}
	if (!fits_pixel_space(m_info.tile_count, m_info.pixels_per_tile)) {
		throw InvalidGridConfig{fmt::format("target resolution of [{}x{}] tiles at [{}x{}] pixels per tile exceeds {} pixels", m_info.tile_count.x,
											m_info.tile_count.y, m_info.pixels_per_tile.x, m_info.pixels_per_tile.y, max_resolution_v)};
	}
}

GridConfig GridConfig::from_target_resolution(Extent2D const pixels_per_tile, Extent2D const resolution, CreateInfo base) {
	if (!is_positive(pixels_per_tile)) {
		throw InvalidGridConfig{fmt::format("invalid pixels_per_tile [{}x{}]: components must be >= 1", pixels_per_tile.x, pixels_per_tile.y)};
	}
	base.pixels_per_tile = pixels_per_tile;
	base.tile_count = resolution / pixels_per_tile;
	if (!is_positive(base.tile_count)) {
		throw InvalidGridConfig{fmt::format("resolution [{}x{}] is smaller than one tile of [{}x{}] pixels", resolution.x, resolution.y,
											pixels_per_tile.x, pixels_per_tile.y)};
	}
	return GridConfig{base};
}

GridConfig GridConfig::pixel_cam(Extent2D const tile_count, Extent2D const pixels_per_tile) {
	return GridConfig{CreateInfo{.tile_count = tile_count, .pixels_per_tile = pixels_per_tile, .world_space = WorldSpace::ePixels}};
}
} // namespace tilecam
