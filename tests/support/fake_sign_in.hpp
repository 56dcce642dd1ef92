#pragma once

#include "costtracker/authorization_receiver.hpp"
#include "costtracker/browser.hpp"
#include "costtracker/error.hpp"
#include "costtracker/http_client.hpp"
#include "costtracker/utils/qs.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace costtracker::testing {

using QueryParams = std::map<std::string, std::string>;

inline QueryParams query_params(const std::string& url) {
  const auto pos = url.find('?');
  return utils::qs::parse(pos == std::string::npos ? std::string() : url.substr(pos + 1));
}

// The redirect a browser would deliver after the user approves the request.
inline AuthorizationResponse approve(const QueryParams& authorize_params, std::string code = "auth-code") {
  AuthorizationResponse response;
  response.code = std::move(code);
  auto state = authorize_params.find("state");
  if (state != authorize_params.end()) {
    response.state = state->second;
  }
  return response;
}

/**
 * Shared script for RecordingBrowserLauncher and ScriptedReceiver. The
 * receiver answers with `respond(params of the last opened URL)`.
 */
struct SignInScript {
  std::string redirect_uri = "http://localhost:53682";
  bool browser_available = true;
  std::function<AuthorizationResponse(const QueryParams&)> respond = [](const QueryParams& params) {
    return approve(params);
  };

  std::vector<std::string> requested_redirects;
  std::vector<std::string> opened_urls;
  std::optional<std::chrono::milliseconds> last_timeout;
  int receivers_created = 0;
  int receivers_destroyed = 0;
};

class RecordingBrowserLauncher final : public BrowserLauncher {
public:
  explicit RecordingBrowserLauncher(SignInScript& script) : script_(script) {}

  bool open(const std::string& url) override {
    script_.opened_urls.push_back(url);
    return script_.browser_available;
  }

private:
  SignInScript& script_;
};

class ScriptedReceiver final : public AuthorizationCodeReceiver {
public:
  explicit ScriptedReceiver(SignInScript& script) : script_(script) { ++script_.receivers_created; }
  ~ScriptedReceiver() override { ++script_.receivers_destroyed; }

  std::string redirect_uri() const override { return script_.redirect_uri; }

  AuthorizationResponse wait_for_response(std::optional<std::chrono::milliseconds> timeout,
                                          const CancellationToken& cancel) override {
    script_.last_timeout = timeout;
    if (cancel.is_cancelled()) {
      throw AuthCancelledError("Sign-in was cancelled");
    }
    if (script_.opened_urls.empty()) {
      throw AuthError("the authorize URL was never opened");
    }
    return script_.respond(query_params(script_.opened_urls.back()));
  }

private:
  SignInScript& script_;
};

inline ReceiverFactory scripted_receivers(SignInScript& script) {
  return [&script](const std::string& redirect_uri) -> std::unique_ptr<AuthorizationCodeReceiver> {
    script.requested_redirects.push_back(redirect_uri);
    return std::make_unique<ScriptedReceiver>(script);
  };
}

inline HttpResponse token_response(const std::string& access_token) {
  return HttpResponse{200, {{"Content-Type", "application/json"}},
                      R"({"token_type":"Bearer","expires_in":3599,"access_token":")" + access_token + R"("})"};
}

}  // namespace costtracker::testing
