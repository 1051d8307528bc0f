#ifndef LOGGING_HPP
#define LOGGING_HPP

#include <string>

namespace locksmith {

enum class LogLevel { DEBUG, INFO, WARN, ERROR };

// Messages below the threshold are dropped. Defaults to INFO.
void set_log_level(LogLevel level);
LogLevel log_level();

// Accepts "debug", "info", "warn", "error". Throws ConfigurationError.
LogLevel parse_log_level(const std::string &name);

// Writes one "[LEVEL] message" line to stderr.
void log(LogLevel level, const std::string &message);

} // namespace locksmith

#endif
