#include <fmt/format.h>
#include <tilecam/util/cli_args.hpp>
#include <algorithm>
#include <iterator>
#include <utility>

namespace tilecam {
namespace {
using cli_args::Option;

std::string_view key_of(Option const& option) { return option.name.empty() ? std::string_view{&option.letter, 1} : option.name; }

std::string spelling(Option const& option) { return option.name.empty() ? fmt::format("-{}", option.letter) : fmt::format("--{}", option.name); }

Option const* find_name(std::span<Option const> options, std::string_view const name) {
	auto const it = std::ranges::find_if(options, [name](Option const& o) { return !o.name.empty() && o.name == name; });
	return it == options.end() ? nullptr : &*it;
}

Option const* find_letter(std::span<Option const> options, char const letter) {
	auto const it = std::ranges::find_if(options, [letter](Option const& o) { return o.letter != '\0' && o.letter == letter; });
	return it == options.end() ? nullptr : &*it;
}

cli_args::Result fail(cli_args::Parsed& out, std::string text) {
	out.text = std::move(text);
	return cli_args::Result::eExitFailure;
}
} // namespace

bool cli_args::Parsed::has(std::string_view const key) const {
	return std::ranges::any_of(options, [key](Match const& m) { return m.key == key; });
}

std::string cli_args::usage(Command const& command) {
	auto ret = fmt::format("Usage: {} [OPTION]... {}\n\nOptions:\n", command.name, command.arguments);
	auto const line = [&ret](Option const& option) {
		auto keys = option.letter ? fmt::format("-{}", option.letter) : std::string{"  "};
		if (!option.name.empty()) { keys += fmt::format("{}--{}", option.letter ? ", " : "  ", option.name); }
		if (option.takes_value()) { keys += fmt::format(" {}", option.value); }
		fmt::format_to(std::back_inserter(ret), "  {:<32} {}\n", keys, option.help);
	};
	for (auto const& option : command.options) { line(option); }
	line(Option{.name = "help", .help = "show this help text"});
	line(Option{.name = "version", .help = "show the version"});
	return ret;
}

auto cli_args::parse(Command const& command, std::span<char const* const> args, Parsed& out) -> Result {
	auto const options = std::span<Option const>{command.options};
	while (!args.empty()) {
		auto arg = std::string_view{args.front()};
		args = args.subspan(1);
		if (arg == "--") { break; }
		if (arg.size() < 2 || arg[0] != '-') {
			out.arguments.push_back(arg);
			continue;
		}

		auto value = std::string_view{};
		auto has_value = false;
		if (auto const eq = arg.find('='); eq != std::string_view::npos) {
			value = arg.substr(eq + 1);
			arg = arg.substr(0, eq);
			has_value = true;
		}

		Option const* option{};
		if (arg[1] == '-') {
			auto const name = arg.substr(2);
			if (name == "help") {
				out.text = usage(command);
				return Result::eExitSuccess;
			}
			if (name == "version") {
				out.text = fmt::format("{} version {}\n", command.name, command.version);
				return Result::eExitSuccess;
			}
			option = find_name(options, name);
		} else if (arg.size() == 2) {
			option = find_letter(options, arg[1]);
		}
		if (!option) { return fail(out, fmt::format("unknown option: {}", arg)); }

		if (!option->takes_value()) {
			if (has_value) { return fail(out, fmt::format("option {} takes no value", spelling(*option))); }
			out.options.push_back({.key = key_of(*option)});
			continue;
		}
		if (!has_value) {
			if (args.empty()) { return fail(out, fmt::format("missing value for option: {} {}", spelling(*option), option->value)); }
			value = args.front();
			args = args.subspan(1);
		}
		if (value.empty()) { return fail(out, fmt::format("missing value for option: {} {}", spelling(*option), option->value)); }
		out.options.push_back({.key = key_of(*option), .value = value});
	}
	for (; !args.empty(); args = args.subspan(1)) { out.arguments.emplace_back(args.front()); }
	return Result::eContinue;
}
} // namespace tilecam
