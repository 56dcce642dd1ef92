#pragma once

#include <map>
#include <stdexcept>
#include <string>
#include <utility>

namespace costtracker {

class CostTrackerError : public std::runtime_error {
public:
  explicit CostTrackerError(const std::string& message)
      : std::runtime_error(message) {}
};

class ConfigError : public CostTrackerError {
public:
  explicit ConfigError(const std::string& message)
      : CostTrackerError(message) {}
};

/**
 * Raised when the interactive login does not yield an access token. `error()`
 * and `error_description()` carry the identity provider's OAuth2 error fields
 * when the provider supplied them.
 */
class AuthError : public CostTrackerError {
public:
  explicit AuthError(const std::string& message,
                     std::string error = {},
                     std::string error_description = {})
      : CostTrackerError(message),
        error_(std::move(error)),
        error_description_(std::move(error_description)) {}

  const std::string& error() const { return error_; }
  const std::string& error_description() const { return error_description_; }

private:
  std::string error_;
  std::string error_description_;
};

class AuthCancelledError : public AuthError {
public:
  using AuthError::AuthError;
};

class AuthTimeoutError : public AuthError {
public:
  using AuthError::AuthError;
};

/**
 * Non-2xx answer from the cost endpoint. The body is kept as raw text; it is
 * never parsed.
 */
class FetchError : public CostTrackerError {
public:
  FetchError(std::string message,
             long status_code,
             std::string body,
             std::map<std::string, std::string> headers = {})
      : CostTrackerError(std::move(message)),
        status_code_(status_code),
        body_(std::move(body)),
        headers_(std::move(headers)) {}

  long status_code() const { return status_code_; }
  const std::string& body() const { return body_; }
  const std::map<std::string, std::string>& headers() const { return headers_; }

private:
  long status_code_;
  std::string body_;
  std::map<std::string, std::string> headers_;
};

// Transport failure before any HTTP status was received.
class ConnectionError : public FetchError {
public:
  explicit ConnectionError(const std::string& message)
      : FetchError(message, 0, {}) {}
};

class ParseError : public CostTrackerError {
public:
  explicit ParseError(const std::string& message)
      : CostTrackerError(message) {}
};

}  // namespace costtracker
