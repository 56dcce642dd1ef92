#pragma once

#include <functional>
#include <map>
#include <ostream>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace costtracker {

enum class LogLevel { Off = 0, Error = 1, Warn = 2, Info = 3, Debug = 4 };

using LoggerCallback = std::function<void(LogLevel level, const std::string& message, const nlohmann::json& details)>;

LogLevel parse_log_level(const std::string& value, LogLevel fallback = LogLevel::Off);

const char* to_string(LogLevel level);

/**
 * Level filter in front of a LoggerCallback. A default-constructed Logger
 * drops everything.
 */
class Logger {
public:
  Logger() = default;
  Logger(LogLevel level, LoggerCallback callback)
      : level_(level), callback_(std::move(callback)) {}

  void log(LogLevel level, const std::string& message, const nlohmann::json& details = {}) const;

  bool enabled(LogLevel level) const;
  LogLevel level() const { return level_; }

private:
  LogLevel level_ = LogLevel::Off;
  LoggerCallback callback_;
};

/**
 * Writes `[cost-tracker] <level>: <message> <details>` lines to `out`. The
 * stream must outlive the returned callback.
 */
LoggerCallback make_stream_logger(std::ostream& out);

/**
 * Copies `headers`, replacing the values of Authorization, Cookie and
 * Set-Cookie (case-insensitive) with `***`.
 */
std::map<std::string, std::string> sanitize_headers(const std::map<std::string, std::string>& headers);

}  // namespace costtracker
