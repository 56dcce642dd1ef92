#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>

namespace costtracker {

struct HttpRequest {
  std::string method;
  std::string url;
  std::map<std::string, std::string> headers;
  std::string body;
  std::chrono::milliseconds timeout{60000};
};

struct HttpResponse {
  long status_code = 0;
  std::map<std::string, std::string> headers;
  std::string body;
};

/**
 * Blocking HTTP transport. Implementations return every response that carries
 * a status line, 4xx and 5xx included, and throw ConnectionError when no
 * response was received at all.
 */
class HttpClient {
public:
  virtual ~HttpClient() = default;
  virtual HttpResponse request(const HttpRequest& request) = 0;
};

std::unique_ptr<HttpClient> make_default_http_client();

inline bool is_success_status(long status_code) {
  return status_code >= 200 && status_code < 300;
}

}  // namespace costtracker
