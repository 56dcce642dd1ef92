#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "costtracker/cancellation.hpp"
#include "costtracker/logging.hpp"

namespace costtracker {

// Query parameters of the browser redirect that ends the authorize step.
struct AuthorizationResponse {
  std::optional<std::string> code;
  std::optional<std::string> state;
  std::optional<std::string> error;
  std::optional<std::string> error_description;
};

class AuthorizationCodeReceiver {
public:
  virtual ~AuthorizationCodeReceiver() = default;

  /**
   * Redirect URI to register with the authorize request. Includes the port
   * actually bound when the configured URI left it out.
   */
  virtual std::string redirect_uri() const = 0;

  /**
   * Blocks until the redirect arrives. Without a timeout the wait only ends
   * on a response or cancellation. Throws AuthCancelledError,
   * AuthTimeoutError, or AuthError if the listener fails.
   */
  virtual AuthorizationResponse wait_for_response(std::optional<std::chrono::milliseconds> timeout,
                                                  const CancellationToken& cancel) = 0;
};

using ReceiverFactory =
    std::function<std::unique_ptr<AuthorizationCodeReceiver>(const std::string& redirect_uri)>;

struct LoopbackAddress {
  std::string host;
  unsigned short port = 0;
  std::string path = "/";
};

/**
 * Splits an `http://<loopback-host>[:port][/path]` redirect URI. The host is
 * `localhost` or a loopback IP literal such as `127.0.0.2` or `[::1]`; the
 * listener binds exactly that address. Throws AuthError for other schemes,
 * other hosts or a bad port.
 */
LoopbackAddress parse_loopback_redirect(const std::string& redirect_uri);

/**
 * Binds a listener on the redirect URI's loopback address right away, so
 * redirect_uri() reports the final port before the browser is opened.
 */
std::unique_ptr<AuthorizationCodeReceiver> make_loopback_receiver(const std::string& redirect_uri,
                                                                  Logger logger = {});

}  // namespace costtracker
