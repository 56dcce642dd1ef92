#include "costtracker/authenticator.hpp"

#include "costtracker/error.hpp"
#include "costtracker/pkce.hpp"
#include "costtracker/utils/qs.hpp"
#include "costtracker/utils/values.hpp"

#include <nlohmann/json.hpp>

#include <utility>

namespace costtracker {
namespace {

using json = nlohmann::json;

std::string describe_provider_error(const std::string& prefix,
                                    const std::string& error,
                                    const std::string& description) {
  std::string message = prefix;
  if (!error.empty()) {
    message += ": " + error;
  }
  if (!description.empty()) {
    message += " (" + description + ")";
  }
  return message;
}

std::string json_string_field(const json& payload, const char* key) {
  if (!payload.is_object()) {
    return {};
  }
  auto it = payload.find(key);
  if (it == payload.end()) {
    return {};
  }
  return utils::scalar_text(*it).value_or("");
}

}  // namespace

std::string authority_url(const std::string& authority_host, const std::string& tenant_id) {
  return utils::strip_trailing_slashes(authority_host) + "/" + utils::qs::percent_encode(tenant_id);
}

std::string join_scopes(const std::vector<std::string>& scopes) {
  std::string joined;
  for (const auto& scope : scopes) {
    if (!joined.empty()) {
      joined.push_back(' ');
    }
    joined += scope;
  }
  return joined;
}

std::string build_authorize_url(const std::string& authority, const AuthorizeRequest& request) {
  utils::qs::Params params = {
      {"client_id", request.client_id},
      {"response_type", "code"},
      {"redirect_uri", request.redirect_uri},
      {"response_mode", "query"},
      {"scope", join_scopes(request.scopes)},
      {"state", request.state},
      {"code_challenge", request.code_challenge},
      {"code_challenge_method", "S256"},
      {"prompt", "select_account"},
  };
  return authority + "/oauth2/v2.0/authorize?" + utils::qs::stringify(params);
}

Authenticator::Authenticator(HttpClient& http,
                             BrowserLauncher& browser,
                             ReceiverFactory receivers,
                             AuthenticatorOptions options,
                             Logger logger)
    : http_(http),
      browser_(browser),
      receivers_(std::move(receivers)),
      options_(std::move(options)),
      logger_(std::move(logger)) {}

std::string Authenticator::acquire_token(const Config& config, const CancellationToken& cancel) const {
  return acquire_token(config.client_id, config.tenant_id, config.redirect_uri, config.scopes, cancel);
}

std::string Authenticator::acquire_token(const std::string& client_id,
                                         const std::string& tenant_id,
                                         const std::string& redirect_uri,
                                         const std::vector<std::string>& scopes,
                                         const CancellationToken& cancel) const {
  if (client_id.empty() || tenant_id.empty()) {
    throw AuthError("A client id and a tenant id are required to sign in");
  }
  if (scopes.empty()) {
    throw AuthError("At least one scope is required to sign in");
  }

  const std::string authority = authority_url(options_.authority_host, tenant_id);

  auto receiver = receivers_(redirect_uri);
  if (!receiver) {
    throw AuthError("No listener is available for the sign-in redirect");
  }
  const std::string effective_redirect = receiver->redirect_uri();

  const PkcePair pkce = make_pkce_pair();
  const std::string state = make_oauth_state();

  AuthorizeRequest request;
  request.client_id = client_id;
  request.redirect_uri = effective_redirect;
  request.scopes = scopes;
  request.state = state;
  request.code_challenge = pkce.challenge;
  const std::string url = build_authorize_url(authority, request);

  logger_.log(LogLevel::Info, "starting interactive sign-in",
              {{"authority", authority}, {"redirect_uri", effective_redirect}});
  if (options_.on_authorize_url) {
    options_.on_authorize_url(url);
  }
  if (!browser_.open(url)) {
    logger_.log(LogLevel::Warn, "could not launch a browser, open the sign-in URL manually");
  }

  const AuthorizationResponse response = receiver->wait_for_response(options_.login_timeout, cancel);
  receiver.reset();

  // Error redirects carry the state too; one without it did not come from this request.
  if (!response.state || *response.state != state) {
    throw AuthError("Sign-in response state does not match the request", "state_mismatch");
  }
  if (response.error) {
    const std::string description = response.error_description.value_or("");
    logger_.log(LogLevel::Error, "sign-in rejected", {{"error", *response.error}, {"error_description", description}});
    throw AuthError(describe_provider_error("Sign-in failed", *response.error, description), *response.error,
                    description);
  }
  if (!response.code || response.code->empty()) {
    throw AuthError("Sign-in response did not include an authorization code");
  }

  return redeem_code(authority, client_id, *response.code, effective_redirect, pkce.verifier, scopes);
}

std::string Authenticator::redeem_code(const std::string& authority,
                                       const std::string& client_id,
                                       const std::string& code,
                                       const std::string& redirect_uri,
                                       const std::string& code_verifier,
                                       const std::vector<std::string>& scopes) const {
  utils::qs::Params form = {
      {"client_id", client_id},
      {"grant_type", "authorization_code"},
      {"code", code},
      {"redirect_uri", redirect_uri},
      {"code_verifier", code_verifier},
      {"scope", join_scopes(scopes)},
  };

  HttpRequest request;
  request.method = "POST";
  request.url = authority + "/oauth2/v2.0/token";
  request.headers["Content-Type"] = "application/x-www-form-urlencoded";
  request.headers["Accept"] = "application/json";
  request.body = utils::qs::stringify(form, utils::qs::Format::RFC1738);
  request.timeout = options_.request_timeout;

  logger_.log(LogLevel::Debug, "redeeming authorization code",
              {{"method", request.method}, {"url", request.url}, {"headers", sanitize_headers(request.headers)}});

  HttpResponse response;
  try {
    response = http_.request(request);
  } catch (const ConnectionError& error) {
    logger_.log(LogLevel::Error, "token request failed", {{"error", error.what()}});
    throw AuthError(std::string("Token request failed: ") + error.what());
  }

  const auto payload = utils::safe_json(response.body);
  const bool provider_error = payload && utils::has_own(*payload, "error");
  if (!is_success_status(response.status_code) || provider_error) {
    std::string error;
    std::string description;
    if (payload) {
      error = json_string_field(*payload, "error");
      description = json_string_field(*payload, "error_description");
    }
    logger_.log(LogLevel::Error, "token request rejected",
                {{"status", response.status_code}, {"error", error}, {"error_description", description}});
    throw AuthError(describe_provider_error("Token request failed with HTTP " + std::to_string(response.status_code),
                                            error, description),
                    error, description);
  }

  if (!payload || !payload->is_object()) {
    throw AuthError("Token response is not a JSON object");
  }
  auto token = payload->find("access_token");
  if (token == payload->end() || !token->is_string() || token->get_ref<const std::string&>().empty()) {
    throw AuthError("Token response did not include an access token");
  }

  logger_.log(LogLevel::Info, "sign-in complete",
              {{"token_type", json_string_field(*payload, "token_type")},
               {"expires_in", json_string_field(*payload, "expires_in")}});
  return token->get<std::string>();
}

}  // namespace costtracker
