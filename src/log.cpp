#include <log.hpp>
#include <atomic>
#include <iostream>
#include <mutex>

static std::atomic<LogLevel> current_level(LogLevel::info);
static std::mutex log_mutex;

static void write_line(LogLevel level, std::ostream& out, const std::string& msg)
{
	if (level < current_level.load()) {
		return;
	}

	std::lock_guard<std::mutex> lock(log_mutex);
	out << msg << std::endl;
}

void set_log_level(LogLevel level)
{
	current_level = level;
}

LogLevel log_level()
{
	return current_level.load();
}

void log_debug(const std::string& msg)
{
	write_line(LogLevel::debug, std::cout, msg);
}

void log_info(const std::string& msg)
{
	write_line(LogLevel::info, std::cout, msg);
}

void log_warning(const std::string& msg)
{
	write_line(LogLevel::warning, std::cerr, "warning: " + msg);
}

void log_error(const std::string& msg)
{
	write_line(LogLevel::error, std::cerr, "error: " + msg);
}
