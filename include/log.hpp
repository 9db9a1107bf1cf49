#ifndef LOG_HPP
#define LOG_HPP

#include <string>

enum class LogLevel {
	debug,
	info,
	warning,
	error,
	off
};

void set_log_level(LogLevel level);
LogLevel log_level();

/* info and debug go to stdout, warnings and errors to stderr */
void log_debug(const std::string& msg);
void log_info(const std::string& msg);
void log_warning(const std::string& msg);
void log_error(const std::string& msg);

#endif /* log.hpp */
