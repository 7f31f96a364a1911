#pragma once
#include <fmt/format.h>
#include <tilecam/defines.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace tilecam {
///
/// \brief Context-tagged logger: errors and warnings go to stderr, the rest to stdout.
///
class Logger {
  public:
	enum class Level : std::uint8_t { eError, eWarn, eInfo, eDebug };

	struct Entry {
		std::string_view context{};
		std::string message{};
		Level level{};
	};

	///
	/// \brief Receives every entry this logger emits, after it has been printed.
	///
	struct Listener {
		virtual ~Listener() = default;
		virtual void on_log(Entry const& entry) = 0;
	};

	explicit Logger(std::string_view context = "tilecam") : context(context) {}

	template <typename... Args>
	void error(fmt::format_string<Args...> fmt, Args&&... args) const {
		log(Level::eError, fmt::format(fmt, std::forward<Args>(args)...));
	}

	template <typename... Args>
	void warn(fmt::format_string<Args...> fmt, Args&&... args) const {
		log(Level::eWarn, fmt::format(fmt, std::forward<Args>(args)...));
	}

	template <typename... Args>
	void info(fmt::format_string<Args...> fmt, Args&&... args) const {
		log(Level::eInfo, fmt::format(fmt, std::forward<Args>(args)...));
	}

	///
	/// \brief Compiled out unless TILECAM_DEBUG is defined.
	///
	template <typename... Args>
	void debug(fmt::format_string<Args...> fmt, Args&&... args) const {
		if constexpr (debug_v) { log(Level::eDebug, fmt::format(fmt, std::forward<Args>(args)...)); }
	}

	void log(Level level, std::string message) const;

	std::string_view context{};
	///
	/// \brief Entries above this level are dropped.
	///
	Level max_level{debug_v ? Level::eDebug : Level::eInfo};
	///
	/// \brief Append the local time to printed lines.
	///
	bool timestamps{true};
	Listener* listener{};
};
} // namespace tilecam
