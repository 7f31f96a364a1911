#include <catch2/catch.hpp>
#include <tilecam/io/common.hpp>
#include <tilecam/util/error.hpp>

using tilecam::Extent2D;
using tilecam::GridConfig;

TEST_CASE("GridConfig reads from JSON", "[io]") {
	auto const json = dj::Json::parse(R"({
		"tile_count": [80, 25],
		"pixels_per_tile": [16, 8],
		"world_space": "pixels",
		"centered": false,
		"depth_range": { "near": -1.0, "far": 10.0 }
	})");
	auto config = GridConfig{};
	tilecam::from_json(json, config);
	REQUIRE(config.tile_count() == Extent2D{80u, 25u});
	REQUIRE(config.pixels_per_tile() == Extent2D{16u, 8u});
	REQUIRE(config.world_space() == tilecam::WorldSpace::ePixels);
	REQUIRE_FALSE(config.centered());
	REQUIRE(config.depth_range().near == -1.0f);
	REQUIRE(config.depth_range().far == 10.0f);
}

TEST_CASE("GridConfig JSON keeps existing values for absent keys", "[io]") {
	auto const json = dj::Json::parse(R"({ "tile_count": [40, 30] })");
	auto config = GridConfig::pixel_cam({1u, 1u}, {4u, 4u});
	tilecam::from_json(json, config);
	REQUIRE(config.tile_count() == Extent2D{40u, 30u});
	REQUIRE(config.pixels_per_tile() == Extent2D{4u, 4u});
	REQUIRE(config.world_space() == tilecam::WorldSpace::ePixels);
	REQUIRE(config.centered());
}

TEST_CASE("GridConfig JSON validates", "[io][error]") {
	auto config = GridConfig{};
	REQUIRE_THROWS_AS(tilecam::from_json(dj::Json::parse(R"({ "tile_count": [0, 25] })"), config), tilecam::InvalidGridConfig);
	REQUIRE_THROWS_AS(tilecam::from_json(dj::Json::parse(R"({ "world_space": "tiles" })"), config), tilecam::InvalidGridConfig);
	REQUIRE(config == GridConfig{});
}

TEST_CASE("GridConfig JSON round trips through to_json", "[io]") {
	auto const config = GridConfig{{.tile_count = {20u, 15u}, .pixels_per_tile = {12u, 12u}, .world_space = tilecam::WorldSpace::ePixels, .centered = false}};
	auto json = dj::Json{};
	tilecam::to_json(json, config);
	REQUIRE(json["world_space"].as_string() == "pixels");
	auto parsed = GridConfig{};
	tilecam::from_json(json, parsed);
	REQUIRE(parsed == config);
}

TEST_CASE("Results write to JSON", "[io]") {
	auto const config = GridConfig{{.tile_count = {80u, 25u}, .pixels_per_tile = {8u, 8u}}};
	auto const fit = tilecam::fit({300, 150}, config);
	auto json = dj::Json{};
	tilecam::to_json(json["fit"], fit);
	tilecam::to_json(json["projection"], tilecam::project(fit, config));
	REQUIRE(json["fit"]["scale"].as<int>() == 1);
	REQUIRE(json["fit"]["clamped"].as<bool>());
	REQUIRE(json["fit"]["viewport_origin"][0].as<int>() == -170);
	REQUIRE(json["projection"]["top"].as<float>() == 13.0f);
}

TEST_CASE("Loading a missing config file throws", "[io][error]") {
	REQUIRE_THROWS_AS(tilecam::load_grid_config("this/path/does/not/exist.json"), tilecam::Error);
}
