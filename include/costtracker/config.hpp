#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "costtracker/logging.hpp"

namespace costtracker {

inline constexpr const char* kDefaultAuthorityHost = "https://login.microsoftonline.com";
inline constexpr const char* kDefaultManagementEndpoint = "https://management.azure.com";
inline constexpr const char* kDefaultApiVersion = "2021-10-01";
inline constexpr const char* kDefaultRedirectUri = "http://localhost";
inline constexpr const char* kDefaultScope = "https://management.azure.com/user_impersonation";
// Ceiling for login_timeout and request_timeout.
inline constexpr std::chrono::seconds kMaxTimeout = std::chrono::hours(24);

struct Config {
  std::string client_id;
  std::string tenant_id;
  std::string subscription_id;
  std::string redirect_uri = kDefaultRedirectUri;
  std::vector<std::string> scopes{kDefaultScope};
  std::string authority_host = kDefaultAuthorityHost;
  std::string management_endpoint = kDefaultManagementEndpoint;
  std::string api_version = kDefaultApiVersion;
  // Unset means the login waits until the user finishes or abandons it.
  std::optional<std::chrono::seconds> login_timeout;
  std::chrono::seconds request_timeout{60};
  LogLevel log_level = LogLevel::Warn;
  bool show_token = false;
  // Exit 0 after printing a fetch failure.
  bool legacy_exit_status = false;
};

/**
 * Builds the startup configuration: defaults, then the JSON file named by
 * COST_TRACKER_CONFIG (if set), then environment variables. Throws
 * ConfigError when a value is malformed or a required field is missing.
 */
Config load_config();

/**
 * Overlays the keys present in `document` onto `config`. `source` names the
 * document in error messages. Unknown keys and wrongly typed values throw
 * ConfigError.
 */
void apply_config_json(Config& config, const nlohmann::json& document, const std::string& source);

void apply_config_file(Config& config, const std::string& path);

void apply_environment(Config& config);

/**
 * Throws ConfigError naming every missing required field at once, or for an
 * endpoint that is not an absolute URL, a redirect URI that is not an
 * `http://` loopback address, or a timeout outside 1 second .. kMaxTimeout.
 */
void validate_config(const Config& config);

}  // namespace costtracker
