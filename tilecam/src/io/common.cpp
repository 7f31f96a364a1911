#include <fmt/format.h>
#include <tilecam/io/common.hpp>
#include <tilecam/util/error.hpp>
#include <filesystem>

namespace tilecam {
namespace fs = std::filesystem;

WorldSpace to_world_space(std::string_view const name) {
	if (name == "units") { return WorldSpace::eUnits; }
	if (name == "pixels") { return WorldSpace::ePixels; }
	throw InvalidGridConfig{fmt::format("unknown world_space: '{}' (expected 'units' or 'pixels')", name)};
}

void from_json(dj::Json const& json, DepthRange& out) {
	out.near = json["near"].as<float>(out.near);
	out.far = json["far"].as<float>(out.far);
}

void to_json(dj::Json& out, DepthRange const& depth_range) {
	out["near"] = depth_range.near;
	out["far"] = depth_range.far;
}

void from_json(dj::Json const& json, GridConfig& out) {
	auto info = out.info();
	if (json.contains("tile_count")) { info.tile_count = glm_vec_from_json<2, std::uint32_t>(json["tile_count"], info.tile_count); }
	if (json.contains("pixels_per_tile")) { info.pixels_per_tile = glm_vec_from_json<2, std::uint32_t>(json["pixels_per_tile"], info.pixels_per_tile); }
	if (json.contains("world_space")) { info.world_space = to_world_space(json["world_space"].as_string()); }
	if (json.contains("depth_range")) { from_json(json["depth_range"], info.depth_range); }
	info.centered = json["centered"].as<bool>(info.centered);
	out = GridConfig{info};
}

void to_json(dj::Json& out, GridConfig const& config) {
	to_json(out["tile_count"], config.tile_count());
	to_json(out["pixels_per_tile"], config.pixels_per_tile());
	out["world_space"] = to_string(config.world_space());
	to_json(out["depth_range"], config.depth_range());
	out["centered"] = dj::Boolean{config.centered()};
}

void to_json(dj::Json& out, FitResult const& fit) {
	to_json(out["window"], fit.window);
	out["scale"] = fit.scale;
	to_json(out["viewport_origin"], fit.viewport_origin);
	to_json(out["viewport_size"], fit.viewport_size);
	out["clamped"] = dj::Boolean{fit.clamped};
}

void to_json(dj::Json& out, ProjectionResult const& projection) {
	out["left"] = projection.left;
	out["right"] = projection.right;
	out["bottom"] = projection.bottom;
	out["top"] = projection.top;
	out["near"] = projection.near;
	out["far"] = projection.far;
	to_json(out["pixels_per_unit"], projection.pixels_per_unit);
}

GridConfig load_grid_config(char const* path) {
	if (!fs::is_regular_file(path)) { throw Error{fmt::format("config file not found: {}", path)}; }
	auto const json = dj::Json::from_file(path);
	if (!json) { throw Error{fmt::format("failed to parse config file: {}", path)}; }
	auto ret = GridConfig{};
	from_json(json, ret);
	return ret;
}
} // namespace tilecam
