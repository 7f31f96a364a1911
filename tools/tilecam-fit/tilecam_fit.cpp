#include <fmt/format.h>
#include <tilecam/build_version.hpp>
#include <tilecam/io/common.hpp>
#include <tilecam/util/cli_args.hpp>
#include <tilecam/util/error.hpp>
#include <tilecam/util/logger.hpp>
#include <cstdio>
#include <cstdlib>
#include <iterator>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cli_args = tilecam::cli_args;

namespace tilecam_fit {
namespace {
struct Args {
	std::string config_path{};
	std::string json_path{};
	std::optional<tilecam::Extent2D> tile_count{};
	std::optional<tilecam::Extent2D> pixels_per_tile{};
	std::optional<tilecam::WorldSpace> world_space{};
	std::optional<float> near{};
	std::optional<float> far{};
	bool anchored{};
	bool verbose{};
	std::vector<tilecam::WindowSize> windows{};
};

cli_args::Command const command_v{
	.name = "tilecam-fit",
	.version = tilecam::build_version_v,
	.arguments = "<width>x<height>...",
	.options =
		{
			{.name = "config", .letter = 'c', .value = "<path.json>", .help = "load grid configuration from a JSON file"},
			{.name = "tiles", .value = "<x>x<y>", .help = "tile count (default 1x1)"},
			{.name = "pixels-per-tile", .value = "<x>x<y>", .help = "pixels per tile (default 8x8)"},
			{.name = "world", .value = "units|pixels", .help = "world space convention"},
			{.name = "anchored", .letter = 'a', .help = "anchor the viewport to the top-left corner"},
			{.name = "near", .value = "<float>", .help = "near plane"},
			{.name = "far", .value = "<float>", .help = "far plane"},
			{.name = "json", .value = "<path.json>", .help = "write results to a JSON file"},
			{.name = "verbose", .letter = 'v', .help = "verbose logging"},
		},
};

// Converts parsed matches into Args; returns an error message on failure.
struct ArgsBuilder {
	Args& out;

	std::string error{};

	bool extent(std::optional<tilecam::Extent2D>& dst, cli_args::Match const& match) {
		auto extent = tilecam::Extent2D{};
		if (!cli_args::as_pair(extent.x, extent.y, match.value)) {
			error = fmt::format("invalid {}: '{}' (expected <x>x<y>)", match.key, match.value);
			return false;
		}
		dst = extent;
		return true;
	}

	bool real(std::optional<float>& dst, cli_args::Match const& match) {
		auto value = float{};
		if (!cli_args::as(value, match.value)) {
			error = fmt::format("invalid {}: '{}'", match.key, match.value);
			return false;
		}
		dst = value;
		return true;
	}

	bool option(cli_args::Match const& match) {
		if (match.key == "config") {
			out.config_path = match.value;
		} else if (match.key == "json") {
			out.json_path = match.value;
		} else if (match.key == "anchored") {
			out.anchored = true;
		} else if (match.key == "verbose") {
			out.verbose = true;
		} else if (match.key == "tiles") {
			return extent(out.tile_count, match);
		} else if (match.key == "pixels-per-tile") {
			return extent(out.pixels_per_tile, match);
		} else if (match.key == "near") {
			return real(out.near, match);
		} else if (match.key == "far") {
			return real(out.far, match);
		} else if (match.key == "world") {
			try {
				out.world_space = tilecam::to_world_space(match.value);
			} catch (tilecam::InvalidGridConfig const& e) {
				error = e.what();
				return false;
			}
		}
		return true;
	}

	bool windows(std::span<std::string_view const> in) {
		if (in.empty()) {
			error = "missing required argument: <width>x<height>";
			return false;
		}
		for (auto const arg : in) {
			auto& window = out.windows.emplace_back();
			if (!cli_args::as_pair(window.x, window.y, arg)) {
				error = fmt::format("invalid window size: '{}' (expected <width>x<height>)", arg);
				return false;
			}
		}
		return true;
	}

	bool operator()(cli_args::Parsed const& parsed) {
		for (auto const& match : parsed.options) {
			if (!option(match)) { return false; }
		}
		return windows(parsed.arguments);
	}
};

struct App {
	Args args{};
	tilecam::Logger log = make_logger();

	static tilecam::Logger make_logger() {
		auto ret = tilecam::Logger{"tilecam-fit"};
		ret.timestamps = false;
		return ret;
	}

	tilecam::GridConfig make_config() const {
		auto config = args.config_path.empty() ? tilecam::GridConfig{} : tilecam::load_grid_config(args.config_path.c_str());
		auto info = config.info();
		if (args.tile_count) { info.tile_count = *args.tile_count; }
		if (args.pixels_per_tile) { info.pixels_per_tile = *args.pixels_per_tile; }
		if (args.world_space) { info.world_space = *args.world_space; }
		if (args.near) { info.depth_range.near = *args.near; }
		if (args.far) { info.depth_range.far = *args.far; }
		if (args.anchored) { info.centered = false; }
		return tilecam::GridConfig{info};
	}

	static void print(tilecam::FitResult const& fit, tilecam::ProjectionResult const& projection) {
		auto text = fmt::format("[{}x{}] scale: {}  viewport: [{}x{}] at [{}, {}]", fit.window.x, fit.window.y, fit.scale, fit.viewport_size.x,
								fit.viewport_size.y, fit.viewport_origin.x, fit.viewport_origin.y);
		if (fit.exceeds_window()) {
			auto const visible = fit.visible_rect().extent();
			fmt::format_to(std::back_inserter(text), " (clip to [{}x{}])", visible.x, visible.y);
		}
		fmt::format_to(std::back_inserter(text), "\n  frustum: l={} r={} b={} t={} n={} f={}  pixels/unit: [{}, {}]\n", projection.left, projection.right,
					   projection.bottom, projection.top, projection.near, projection.far, projection.pixels_per_unit.x, projection.pixels_per_unit.y);
		std::printf("%s", text.c_str());
	}

	bool run(std::span<char const* const> in) {
		auto parsed = cli_args::Parsed{};
		switch (cli_args::parse(command_v, in, parsed)) {
		case cli_args::Result::eExitSuccess: std::printf("%s", parsed.text.c_str()); return true;
		case cli_args::Result::eExitFailure: log.error("{}", parsed.text); return false;
		default: break;
		}
		if (auto builder = ArgsBuilder{args}; !builder(parsed)) {
			log.error("{}", builder.error);
			return false;
		}
		if (!args.verbose) { log.max_level = tilecam::Logger::Level::eWarn; }

		auto config = tilecam::GridConfig{};
		try {
			config = make_config();
		} catch (tilecam::Error const& e) {
			log.error("{}", e.what());
			return false;
		}
		auto const target = config.target_resolution();
		log.info("{}x{} tiles at {}x{} pixels per tile => target [{}x{}], world space: {}", config.tile_count().x, config.tile_count().y,
				 config.pixels_per_tile().x, config.pixels_per_tile().y, target.x, target.y, tilecam::to_string(config.world_space()));

		auto out_json = dj::Json{};
		tilecam::to_json(out_json["config"], config);
		auto out_results = dj::Json{};
		for (auto const window : args.windows) {
			auto fit = tilecam::FitResult{};
			try {
				fit = tilecam::fit(window, config);
			} catch (tilecam::InvalidWindowSize const& e) {
				log.warn("{}; skipping", e.what());
				continue;
			}
			auto const projection = tilecam::project(fit, config);
			print(fit, projection);

			auto out_result = dj::Json{};
			tilecam::to_json(out_result["fit"], fit);
			tilecam::to_json(out_result["projection"], projection);
			out_results.push_back(std::move(out_result));
		}
		out_json["results"] = std::move(out_results);

		if (!args.json_path.empty()) {
			if (!out_json.to_file(args.json_path.c_str())) {
				log.error("failed to write JSON to {}", args.json_path);
				return false;
			}
			log.info("results written to {}", args.json_path);
		}
		return true;
	}
};
} // namespace
} // namespace tilecam_fit

int main(int argc, char** argv) {
	if (!tilecam_fit::App{}.run({argv + 1, static_cast<std::size_t>(argc - 1)})) { return EXIT_FAILURE; }
}
