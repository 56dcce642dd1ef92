#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "costtracker/authorization_receiver.hpp"
#include "costtracker/browser.hpp"
#include "costtracker/cancellation.hpp"
#include "costtracker/config.hpp"
#include "costtracker/http_client.hpp"
#include "costtracker/logging.hpp"

namespace costtracker {

struct AuthenticatorOptions {
  std::string authority_host = kDefaultAuthorityHost;
  // Unset keeps the interactive wait open until the user acts.
  std::optional<std::chrono::milliseconds> login_timeout;
  std::chrono::milliseconds request_timeout{60000};
  // Called with the authorize URL before the browser is launched.
  std::function<void(const std::string& url)> on_authorize_url;
};

struct AuthorizeRequest {
  std::string client_id;
  std::string redirect_uri;
  std::vector<std::string> scopes;
  std::string state;
  std::string code_challenge;
};

// `{authority_host}/{tenant_id}`
std::string authority_url(const std::string& authority_host, const std::string& tenant_id);

std::string build_authorize_url(const std::string& authority, const AuthorizeRequest& request);

std::string join_scopes(const std::vector<std::string>& scopes);

/**
 * Interactive sign-in against Microsoft Entra ID using the authorization code
 * flow with PKCE and a loopback redirect. Nothing is cached: every call runs
 * the full browser flow.
 */
class Authenticator {
public:
  Authenticator(HttpClient& http,
                BrowserLauncher& browser,
                ReceiverFactory receivers,
                AuthenticatorOptions options = {},
                Logger logger = {});

  /**
   * Runs the browser sign-in and returns the access token. Throws AuthError
   * (or AuthCancelledError / AuthTimeoutError) when no token is obtained.
   */
  std::string acquire_token(const std::string& client_id,
                            const std::string& tenant_id,
                            const std::string& redirect_uri,
                            const std::vector<std::string>& scopes,
                            const CancellationToken& cancel = {}) const;

  std::string acquire_token(const Config& config, const CancellationToken& cancel = {}) const;

private:
  std::string redeem_code(const std::string& authority,
                          const std::string& client_id,
                          const std::string& code,
                          const std::string& redirect_uri,
                          const std::string& code_verifier,
                          const std::vector<std::string>& scopes) const;

  HttpClient& http_;
  BrowserLauncher& browser_;
  ReceiverFactory receivers_;
  AuthenticatorOptions options_;
  Logger logger_;
};

}  // namespace costtracker
