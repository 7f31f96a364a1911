#include <catch2/catch.hpp>
#include <fmt/format.h>
#include <tilecam/util/cli_args.hpp>
#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace cli_args = tilecam::cli_args;

namespace {
cli_args::Command const command_v{
	.name = "test",
	.version = "1.2.3",
	.arguments = "<window>...",
	.options =
		{
			{.name = "tiles", .value = "<x>x<y>", .help = "tile count"},
			{.name = "verbose", .letter = 'v', .help = "verbose"},
			{.name = "config", .letter = 'c', .value = "<path>", .help = "config"},
		},
};

template <std::size_t N>
cli_args::Result parse(std::array<char const*, N> const& argv, cli_args::Parsed& out) {
	return cli_args::parse(command_v, argv, out);
}

std::vector<std::string> keys_and_values(cli_args::Parsed const& parsed) {
	auto ret = std::vector<std::string>{};
	for (auto const& match : parsed.options) { ret.push_back(fmt::format("{}={}", match.key, match.value)); }
	return ret;
}
} // namespace

TEST_CASE("cli_args parses long, short and positional arguments", "[cli_args]") {
	auto const argv = std::array<char const*, 7>{"--tiles=80x25", "640x480", "-v", "-c", "grid.json", "--tiles", "800x600"};
	auto parsed = cli_args::Parsed{};
	REQUIRE(parse(argv, parsed) == cli_args::Result::eContinue);
	REQUIRE(keys_and_values(parsed) == std::vector<std::string>{"tiles=80x25", "verbose=", "config=grid.json", "tiles=800x600"});
	REQUIRE(parsed.arguments == std::vector<std::string_view>{"640x480"});
	REQUIRE(parsed.has("verbose"));
	REQUIRE_FALSE(parsed.has("json"));
}

TEST_CASE("cli_args rejects unknown options and missing values", "[cli_args]") {
	auto parsed = cli_args::Parsed{};
	REQUIRE(parse(std::array<char const*, 1>{"--bogus"}, parsed) == cli_args::Result::eExitFailure);
	REQUIRE(parsed.text.find("--bogus") != std::string::npos);

	parsed = {};
	REQUIRE(parse(std::array<char const*, 1>{"--tiles"}, parsed) == cli_args::Result::eExitFailure);
	REQUIRE(parsed.text.find("missing value") != std::string::npos);

	parsed = {};
	REQUIRE(parse(std::array<char const*, 1>{"-c="}, parsed) == cli_args::Result::eExitFailure);

	parsed = {};
	REQUIRE(parse(std::array<char const*, 1>{"--verbose=yes"}, parsed) == cli_args::Result::eExitFailure);
}

TEST_CASE("cli_args treats everything after a double dash as positional", "[cli_args]") {
	auto parsed = cli_args::Parsed{};
	REQUIRE(parse(std::array<char const*, 4>{"-v", "--", "-5x3", "--tiles"}, parsed) == cli_args::Result::eContinue);
	REQUIRE(parsed.arguments == std::vector<std::string_view>{"-5x3", "--tiles"});
	REQUIRE(parsed.options.size() == 1);
}

TEST_CASE("cli_args answers help and version", "[cli_args]") {
	auto parsed = cli_args::Parsed{};
	REQUIRE(parse(std::array<char const*, 2>{"--version", "--bogus"}, parsed) == cli_args::Result::eExitSuccess);
	REQUIRE(parsed.text == "test version 1.2.3\n");

	parsed = {};
	REQUIRE(parse(std::array<char const*, 1>{"--help"}, parsed) == cli_args::Result::eExitSuccess);
	REQUIRE(parsed.text.find("Usage: test [OPTION]... <window>...") == 0);
	REQUIRE(parsed.text.find("-c, --config <path>") != std::string::npos);
	REQUIRE(parsed.text.find("--tiles <x>x<y>") != std::string::npos);
}

TEST_CASE("cli_args converts values", "[cli_args]") {
	auto x = int{};
	auto y = int{};
	REQUIRE(cli_args::as_pair(x, y, "1920x1080"));
	REQUIRE(x == 1920);
	REQUIRE(y == 1080);
	REQUIRE(cli_args::as_pair(x, y, "-5x3"));
	REQUIRE(x == -5);
	REQUIRE_FALSE(cli_args::as_pair(x, y, "1920"));
	REQUIRE_FALSE(cli_args::as_pair(x, y, "12ax4"));

	auto f = float{};
	REQUIRE(cli_args::as(f, "0.5"));
	REQUIRE(f == 0.5f);
	REQUIRE_FALSE(cli_args::as(f, ""));
}
