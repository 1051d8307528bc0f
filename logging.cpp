#include "logging.hpp"
#include "errors.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace locksmith {

namespace {
std::atomic<LogLevel> threshold{LogLevel::INFO};
std::mutex output_mutex; // keeps lines from different threads whole
} // namespace

void set_log_level(LogLevel level) { threshold.store(level); }

LogLevel log_level() { return threshold.load(); }

LogLevel parse_log_level(const std::string &name) {
  if (name == "debug")
    return LogLevel::DEBUG;
  if (name == "info")
    return LogLevel::INFO;
  if (name == "warn" || name == "warning")
    return LogLevel::WARN;
  if (name == "error")
    return LogLevel::ERROR;
  throw ConfigurationError("Unknown log level: " + name);
}

void log(LogLevel level, const std::string &message) {
  if (level < threshold.load())
    return;

  const char *prefix = "[INFO]";
  switch (level) {
  case LogLevel::DEBUG:
    prefix = "[DEBUG]";
    break;
  case LogLevel::INFO:
    prefix = "[INFO]";
    break;
  case LogLevel::WARN:
    prefix = "[WARN]";
    break;
  case LogLevel::ERROR:
    prefix = "[ERROR]";
    break;
  }

  std::lock_guard<std::mutex> guard(output_mutex);
  std::cerr << prefix << " " << message << std::endl;
}

} // namespace locksmith
