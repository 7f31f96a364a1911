#pragma once
#include <charconv>
#include <concepts>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace tilecam::cli_args {
enum class Result { eContinue, eExitSuccess, eExitFailure };

///
/// \brief A command line option: --name, -letter, or both.
///
struct Option {
	std::string_view name{};
	char letter{};
	///
	/// \brief Placeholder for the value shown in usage; empty for flags.
	///
	std::string_view value{};
	std::string_view help{};

	bool takes_value() const { return !value.empty(); }
};

struct Command {
	std::string_view name{};
	std::string_view version{"(unknown)"};
	///
	/// \brief Positional arguments shown in usage, eg "<width>x<height>...".
	///
	std::string_view arguments{};
	std::vector<Option> options{};
};

///
/// \brief An option found on the command line, identified by its long name (or letter if it has none).
///
struct Match {
	std::string_view key{};
	std::string_view value{};
};

struct Parsed {
	std::vector<Match> options{};
	std::vector<std::string_view> arguments{};
	///
	/// \brief Usage / version text on eExitSuccess, the error on eExitFailure.
	///
	std::string text{};

	bool has(std::string_view key) const;
};

///
/// \brief Parse options and positional arguments.
/// \param command Accepted options; --help and --version are always accepted
/// \param args Command line arguments, excluding the executable path
/// \param out Receives matched options, positional arguments and any text to print
///
/// Values are given as --name=value, --name value, -l=value or -l value.
/// Everything after a bare "--" is positional.
/// Keys and values in out view into command and args, which must outlive it.
///
Result parse(Command const& command, std::span<char const* const> args, Parsed& out);

std::string usage(Command const& command);

///
/// \brief Parse an arithmetic value, requiring the whole string to be consumed.
///
template <typename Type>
	requires(std::integral<Type> || std::floating_point<Type>)
bool as(Type& out, std::string_view const value) {
	if (value.empty()) { return false; }
	auto const* end = value.data() + value.size();
	auto const [ptr, ec] = std::from_chars(value.data(), end, out);
	return ec == std::errc{} && ptr == end;
}

///
/// \brief Parse a pair of the form "<x>x<y>" (eg "80x25").
///
template <std::integral Type>
bool as_pair(Type& out_x, Type& out_y, std::string_view const value) {
	auto const it = value.find('x');
	if (it == std::string_view::npos) { return false; }
	return as(out_x, value.substr(0, it)) && as(out_y, value.substr(it + 1));
}
} // namespace tilecam::cli_args
