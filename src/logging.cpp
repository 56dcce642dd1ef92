#include "costtracker/logging.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <set>

namespace costtracker {
namespace {

std::string lowercase(const std::string& value) {
  std::string lowered;
  lowered.reserve(value.size());
  std::transform(value.begin(), value.end(), std::back_inserter(lowered),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

}  // namespace

LogLevel parse_log_level(const std::string& value, LogLevel fallback) {
  const std::string lowered = lowercase(value);
  if (lowered == "off") return LogLevel::Off;
  if (lowered == "error") return LogLevel::Error;
  if (lowered == "warn" || lowered == "warning") return LogLevel::Warn;
  if (lowered == "info") return LogLevel::Info;
  if (lowered == "debug") return LogLevel::Debug;
  return fallback;
}

const char* to_string(LogLevel level) {
  switch (level) {
    case LogLevel::Off:
      return "off";
    case LogLevel::Error:
      return "error";
    case LogLevel::Warn:
      return "warn";
    case LogLevel::Info:
      return "info";
    case LogLevel::Debug:
      return "debug";
  }
  return "unknown";
}

bool Logger::enabled(LogLevel level) const {
  if (!callback_ || level == LogLevel::Off) {
    return false;
  }
  return static_cast<int>(level) <= static_cast<int>(level_);
}

void Logger::log(LogLevel level, const std::string& message, const nlohmann::json& details) const {
  if (!enabled(level)) {
    return;
  }
  callback_(level, message, details);
}

LoggerCallback make_stream_logger(std::ostream& out) {
  return [&out](LogLevel level, const std::string& message, const nlohmann::json& details) {
    out << "[cost-tracker] " << to_string(level) << ": " << message;
    if (!details.is_null() && !(details.is_object() && details.empty())) {
      out << ' ' << details.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    out << '\n';
    out.flush();
  };
}

std::map<std::string, std::string> sanitize_headers(const std::map<std::string, std::string>& headers) {
  static const std::set<std::string> kSensitive = {"authorization", "cookie", "set-cookie"};
  std::map<std::string, std::string> sanitized;
  for (const auto& [key, value] : headers) {
    if (kSensitive.count(lowercase(key))) {
      sanitized[key] = "***";
    } else {
      sanitized[key] = value;
    }
  }
  return sanitized;
}

}  // namespace costtracker
