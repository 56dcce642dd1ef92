#include "costtracker/config.hpp"

#include "costtracker/authorization_receiver.hpp"
#include "costtracker/error.hpp"
#include "costtracker/utils/env.hpp"
#include "costtracker/utils/values.hpp"

#include <cstdint>
#include <fstream>
#include <set>
#include <sstream>
#include <string>

namespace costtracker {
namespace {

using json = nlohmann::json;

const std::set<std::string> kKnownKeys = {
    "client_id",
    "tenant_id",
    "subscription_id",
    "redirect_uri",
    "scopes",
    "authority_host",
    "management_endpoint",
    "api_version",
    "login_timeout_seconds",
    "request_timeout_seconds",
    "log_level",
    "show_token",
    "legacy_exit_status",
};

std::string type_error(const std::string& source, const std::string& key, const char* expected) {
  return source + ": \"" + key + "\" must be " + expected;
}

std::string read_string(const json& document, const std::string& key, const std::string& source) {
  const auto& value = document.at(key);
  if (!value.is_string()) {
    throw ConfigError(type_error(source, key, "a string"));
  }
  return value.get<std::string>();
}

bool read_bool(const json& document, const std::string& key, const std::string& source) {
  const auto& value = document.at(key);
  if (!value.is_boolean()) {
    throw ConfigError(type_error(source, key, "a boolean"));
  }
  return value.get<bool>();
}

std::int64_t read_seconds(const json& document, const std::string& key, const std::string& source) {
  const auto& value = document.at(key);
  if (!value.is_number_integer() || value.get<std::int64_t>() < 0) {
    throw ConfigError(type_error(source, key, "a non-negative integer"));
  }
  return value.get<std::int64_t>();
}

std::vector<std::string> split_scopes(const std::string& value) {
  std::vector<std::string> scopes;
  std::istringstream stream(value);
  std::string scope;
  while (stream >> scope) {
    scopes.push_back(scope);
  }
  return scopes;
}

std::optional<std::chrono::seconds> login_timeout_from(std::int64_t seconds) {
  if (seconds == 0) {
    return std::nullopt;
  }
  return std::chrono::seconds(seconds);
}

LogLevel parse_log_level_strict(const std::string& value, const std::string& source) {
  // An unrecognized value is the only one that yields each fallback back.
  const LogLevel parsed = parse_log_level(value, LogLevel::Off);
  if (parsed != parse_log_level(value, LogLevel::Debug)) {
    throw ConfigError(source + ": unknown log level \"" + value + "\"");
  }
  return parsed;
}

bool env_bool(const char* name, bool current) {
  auto raw = utils::read_env(name);
  if (!raw || raw->empty()) {
    return current;
  }
  auto parsed = utils::maybe_coerce_boolean(*raw);
  if (!parsed) {
    throw ConfigError(std::string(name) + " must be one of 1/0, true/false, yes/no, on/off");
  }
  return *parsed;
}

std::optional<std::int64_t> env_seconds(const char* name) {
  auto raw = utils::read_env(name);
  if (!raw || raw->empty()) {
    return std::nullopt;
  }
  auto parsed = utils::maybe_coerce_non_negative(*raw);
  if (!parsed) {
    throw ConfigError(std::string(name) + " must be a non-negative number of seconds");
  }
  return parsed;
}

}  // namespace

void apply_config_json(Config& config, const nlohmann::json& document, const std::string& source) {
  if (!document.is_object()) {
    throw ConfigError(source + ": expected a JSON object");
  }
  for (const auto& item : document.items()) {
    if (!kKnownKeys.count(item.key())) {
      throw ConfigError(source + ": unknown key \"" + item.key() + "\"");
    }
  }

  if (utils::has_own(document, "client_id")) config.client_id = read_string(document, "client_id", source);
  if (utils::has_own(document, "tenant_id")) config.tenant_id = read_string(document, "tenant_id", source);
  if (utils::has_own(document, "subscription_id")) {
    config.subscription_id = read_string(document, "subscription_id", source);
  }
  if (utils::has_own(document, "redirect_uri")) {
    config.redirect_uri = read_string(document, "redirect_uri", source);
  }
  if (utils::has_own(document, "scopes")) {
    const auto& scopes = document.at("scopes");
    if (!scopes.is_array()) {
      throw ConfigError(type_error(source, "scopes", "an array of strings"));
    }
    std::vector<std::string> parsed;
    for (const auto& scope : scopes) {
      if (!scope.is_string()) {
        throw ConfigError(type_error(source, "scopes", "an array of strings"));
      }
      parsed.push_back(scope.get<std::string>());
    }
    config.scopes = std::move(parsed);
  }
  if (utils::has_own(document, "authority_host")) {
    config.authority_host = utils::strip_trailing_slashes(read_string(document, "authority_host", source));
  }
  if (utils::has_own(document, "management_endpoint")) {
    config.management_endpoint =
        utils::strip_trailing_slashes(read_string(document, "management_endpoint", source));
  }
  if (utils::has_own(document, "api_version")) {
    config.api_version = read_string(document, "api_version", source);
  }
  if (utils::has_own(document, "login_timeout_seconds")) {
    config.login_timeout = login_timeout_from(read_seconds(document, "login_timeout_seconds", source));
  }
  if (utils::has_own(document, "request_timeout_seconds")) {
    config.request_timeout = std::chrono::seconds(read_seconds(document, "request_timeout_seconds", source));
  }
  if (utils::has_own(document, "log_level")) {
    config.log_level = parse_log_level_strict(read_string(document, "log_level", source), source);
  }
  if (utils::has_own(document, "show_token")) {
    config.show_token = read_bool(document, "show_token", source);
  }
  if (utils::has_own(document, "legacy_exit_status")) {
    config.legacy_exit_status = read_bool(document, "legacy_exit_status", source);
  }
}

void apply_config_file(Config& config, const std::string& path) {
  std::ifstream input(path);
  if (!input) {
    throw ConfigError("Unable to open config file " + path);
  }
  json document;
  try {
    document = json::parse(input);
  } catch (const json::exception& ex) {
    throw ConfigError("Config file " + path + " is not valid JSON: " + ex.what());
  }
  apply_config_json(config, document, path);
}

void apply_environment(Config& config) {
  if (auto value = utils::read_first_env({"COST_TRACKER_CLIENT_ID", "AZURE_CLIENT_ID"})) {
    config.client_id = *value;
  }
  if (auto value = utils::read_first_env({"COST_TRACKER_TENANT_ID", "AZURE_TENANT_ID"})) {
    config.tenant_id = *value;
  }
  if (auto value = utils::read_first_env({"COST_TRACKER_SUBSCRIPTION_ID", "AZURE_SUBSCRIPTION_ID"})) {
    config.subscription_id = *value;
  }
  if (auto value = utils::read_first_env({"COST_TRACKER_REDIRECT_URI"})) {
    config.redirect_uri = *value;
  }
  if (auto value = utils::read_first_env({"COST_TRACKER_SCOPES"})) {
    config.scopes = split_scopes(*value);
  }
  if (auto value = utils::read_first_env({"AZURE_AUTHORITY_HOST"})) {
    config.authority_host = utils::strip_trailing_slashes(*value);
  }
  if (auto value = utils::read_first_env({"COST_TRACKER_MANAGEMENT_ENDPOINT"})) {
    config.management_endpoint = utils::strip_trailing_slashes(*value);
  }
  if (auto value = utils::read_first_env({"COST_TRACKER_API_VERSION"})) {
    config.api_version = *value;
  }
  if (auto seconds = env_seconds("COST_TRACKER_LOGIN_TIMEOUT")) {
    config.login_timeout = login_timeout_from(*seconds);
  }
  if (auto seconds = env_seconds("COST_TRACKER_REQUEST_TIMEOUT")) {
    config.request_timeout = std::chrono::seconds(*seconds);
  }
  if (auto value = utils::read_first_env({"COST_TRACKER_LOG"})) {
    config.log_level = parse_log_level_strict(*value, "COST_TRACKER_LOG");
  }
  config.show_token = env_bool("COST_TRACKER_SHOW_TOKEN", config.show_token);
  config.legacy_exit_status = env_bool("COST_TRACKER_LEGACY_EXIT_STATUS", config.legacy_exit_status);
}

void validate_config(const Config& config) {
  std::vector<std::string> missing;
  if (config.client_id.empty()) missing.emplace_back("client_id (COST_TRACKER_CLIENT_ID)");
  if (config.tenant_id.empty()) missing.emplace_back("tenant_id (COST_TRACKER_TENANT_ID)");
  if (config.subscription_id.empty()) missing.emplace_back("subscription_id (COST_TRACKER_SUBSCRIPTION_ID)");
  if (!missing.empty()) {
    std::string message = "Missing required configuration: ";
    for (std::size_t i = 0; i < missing.size(); ++i) {
      if (i > 0) {
        message += ", ";
      }
      message += missing[i];
    }
    throw ConfigError(message);
  }

  if (config.scopes.empty()) {
    throw ConfigError("At least one scope is required");
  }
  if (!utils::is_absolute_url(config.authority_host)) {
    throw ConfigError("authority_host must be an absolute URL: " + config.authority_host);
  }
  if (!utils::is_absolute_url(config.management_endpoint)) {
    throw ConfigError("management_endpoint must be an absolute URL: " + config.management_endpoint);
  }
  try {
    parse_loopback_redirect(config.redirect_uri);
  } catch (const AuthError& error) {
    throw ConfigError(std::string("redirect_uri: ") + error.what());
  }
  if (config.request_timeout.count() <= 0) {
    throw ConfigError("request_timeout must be at least one second");
  }
  if (config.request_timeout > kMaxTimeout) {
    throw ConfigError("request_timeout must not exceed " + std::to_string(kMaxTimeout.count()) + " seconds");
  }
  if (config.login_timeout && (config.login_timeout->count() <= 0 || *config.login_timeout > kMaxTimeout)) {
    throw ConfigError("login_timeout must be between 1 and " + std::to_string(kMaxTimeout.count()) +
                      " seconds, or 0 for no timeout");
  }
}

Config load_config() {
  Config config;
  if (auto path = utils::read_first_env({"COST_TRACKER_CONFIG"})) {
    apply_config_file(config, *path);
  }
  apply_environment(config);
  validate_config(config);
  return config;
}

}  // namespace costtracker
