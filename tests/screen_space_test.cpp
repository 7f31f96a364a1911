#include <catch2/catch.hpp>
#include <tilecam/screen_space.hpp>

using tilecam::GridConfig;

namespace {
GridConfig const small_grid{{.tile_count = {10u, 10u}, .pixels_per_tile = {8u, 8u}}};
} // namespace

TEST_CASE("Screen to world maps viewport corners to frustum corners", "[screen_space]") {
	// 80x80 target at scale 2 inside 200x180: viewport 160x160 at (20, 10)
	auto const fit = tilecam::fit({200, 180}, small_grid);
	REQUIRE(fit.scale == 2);
	REQUIRE(fit.viewport_origin == glm::ivec2{20, 10});
	auto const projection = tilecam::project(fit, small_grid);

	auto const top_left = tilecam::screen_to_world(fit, projection, {20.0f, 10.0f});
	REQUIRE(top_left);
	REQUIRE(top_left->x == Approx(-5.0f));
	REQUIRE(top_left->y == Approx(5.0f));

	auto const centre = tilecam::screen_to_world(fit, projection, {100.0f, 90.0f});
	REQUIRE(centre);
	REQUIRE(centre->x == Approx(0.0f));
	REQUIRE(centre->y == Approx(0.0f));

	auto const tile = tilecam::screen_to_world(fit, projection, {20.0f + 16.0f, 10.0f + 16.0f});
	REQUIRE(tile);
	REQUIRE(tile->x == Approx(-4.0f));
	REQUIRE(tile->y == Approx(4.0f));
}

TEST_CASE("Screen to world rejects positions outside the viewport", "[screen_space]") {
	auto const fit = tilecam::fit({200, 180}, small_grid);
	auto const projection = tilecam::project(fit, small_grid);
	REQUIRE_FALSE(tilecam::screen_to_world(fit, projection, {5.0f, 90.0f}));
	REQUIRE_FALSE(tilecam::screen_to_world(fit, projection, {100.0f, 175.0f}));
	REQUIRE_FALSE(tilecam::screen_to_world(fit, projection, {180.0f, 90.0f}));
}

TEST_CASE("Screen to world rejects clipped parts of an oversized viewport", "[screen_space]") {
	auto const fit = tilecam::fit({40, 40}, small_grid);
	REQUIRE(fit.exceeds_window());
	auto const projection = tilecam::project(fit, small_grid);
	REQUIRE_FALSE(tilecam::screen_to_world(fit, projection, {-1.0f, 10.0f}));
	auto const centre = tilecam::screen_to_world(fit, projection, {20.0f, 20.0f});
	REQUIRE(centre);
	REQUIRE(centre->x == Approx(0.0f));
	REQUIRE(centre->y == Approx(0.0f));
}

TEST_CASE("Screen to world applies the camera position", "[screen_space]") {
	auto const fit = tilecam::fit({200, 180}, small_grid);
	auto const projection = tilecam::project(fit, small_grid);
	auto const world = tilecam::screen_to_world(fit, projection, {100.0f, 90.0f}, {3.0f, -2.0f});
	REQUIRE(world);
	REQUIRE(world->x == Approx(3.0f));
	REQUIRE(world->y == Approx(-2.0f));
}

TEST_CASE("World to screen inverts screen to world", "[screen_space]") {
	auto const config = GridConfig::pixel_cam({15u, 15u});
	auto const fit = tilecam::fit({500, 400}, config);
	auto const projection = tilecam::project(fit, config);
	auto const camera = glm::vec2{12.0f, 7.0f};
	auto const screen = glm::vec2{251.0f, 133.0f};
	auto const world = tilecam::screen_to_world(fit, projection, screen, camera);
	REQUIRE(world);
	auto const back = tilecam::world_to_screen(fit, projection, *world, camera);
	REQUIRE(back.x == Approx(screen.x));
	REQUIRE(back.y == Approx(screen.y));
}
