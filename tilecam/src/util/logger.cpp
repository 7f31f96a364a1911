#include <tilecam/util/logger.hpp>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <utility>

namespace tilecam {
namespace {
constexpr char level_char(Logger::Level const level) {
	switch (level) {
	case Logger::Level::eError: return 'E';
	case Logger::Level::eWarn: return 'W';
	case Logger::Level::eInfo: return 'I';
	case Logger::Level::eDebug: return 'D';
	default: return '?';
	}
}

std::string timestamp() {
	auto const now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
	char buffer[16]{};
	if (!std::strftime(buffer, sizeof(buffer), "%H:%M:%S", std::localtime(&now))) { return {}; }
	return buffer;
}
} // namespace

void Logger::log(Level const level, std::string message) const {
	if (level > max_level) { return; }
	auto line = fmt::format("[{}] [{}] {}", level_char(level), context, message);
	if (timestamps) { line += fmt::format(" [{}]", timestamp()); }
	std::fprintf(level <= Level::eWarn ? stderr : stdout, "%s\n", line.c_str());
	if (listener) { listener->on_log(Entry{.context = context, .message = std::move(message), .level = level}); }
}
} // namespace tilecam
