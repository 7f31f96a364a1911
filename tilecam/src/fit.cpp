#include <fmt/format.h>
#include <tilecam/fit.hpp>
#include <tilecam/util/error.hpp>
#include <algorithm>

namespace tilecam {
namespace {
// Rounds towards negative infinity, unlike built-in integer division.
constexpr int floor_div(int const num, int const den) {
	auto const quot = num / den;
	return (num % den != 0 && (num < 0) != (den < 0)) ? quot - 1 : quot;
}

static_assert(floor_div(7, 2) == 3);
static_assert(floor_div(-7, 2) == -4);
static_assert(floor_div(-340, 2) == -170);
} // namespace

bool FitResult::exceeds_window() const {
	auto const end = viewport_origin + viewport_size;
	return viewport_origin.x < 0 || viewport_origin.y < 0 || end.x > window.x || end.y > window.y;
}

FitResult fit(WindowSize const window, GridConfig const& config) {
	if (window.x <= 0 || window.y <= 0) { throw InvalidWindowSize{fmt::format("invalid window size [{}x{}]: components must be > 0", window.x, window.y)}; }

	auto ret = FitResult{
		.window = window,
		.tile_count = config.tile_count(),
		.pixels_per_tile = config.pixels_per_tile(),
		.centered = config.centered(),
	};

	// GridConfig guarantees the target fits in int.
	auto const target = ret.target_resolution();
	auto const candidates = window / target;
	auto const scale = std::min(candidates.x, candidates.y);
	ret.clamped = scale < 1;
	ret.scale = std::max(1, scale);
	ret.viewport_size = target * ret.scale;

	if (ret.centered) {
		auto const margin = window - ret.viewport_size;
		ret.viewport_origin = {floor_div(margin.x, 2), floor_div(margin.y, 2)};
	}

	return ret;
}

FitResult fit(WindowSize const window, Extent2D const tile_count, Extent2D const pixels_per_tile, bool const centered) {
	auto const config = GridConfig{GridConfig::CreateInfo{.tile_count = tile_count, .pixels_per_tile = pixels_per_tile, .centered = centered}};
	return fit(window, config);
}
} // namespace tilecam
