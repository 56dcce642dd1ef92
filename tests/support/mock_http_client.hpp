#pragma once

#include "costtracker/error.hpp"
#include "costtracker/http_client.hpp"

#include <cstddef>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace costtracker::testing {

/**
 * In-memory HttpClient that replays queued responses and records every
 * request it receives.
 */
class MockHttpClient final : public HttpClient {
public:
  struct EnqueuedError {
    std::string message;
  };

  using Enqueued = std::variant<HttpResponse, EnqueuedError>;

  HttpResponse request(const HttpRequest& request) override {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.push_back(request);
    if (responses_.empty()) {
      throw std::logic_error("MockHttpClient queue underflow");
    }

    auto next = std::move(responses_.front());
    responses_.pop();

    if (std::holds_alternative<EnqueuedError>(next)) {
      throw ConnectionError(std::get<EnqueuedError>(next).message);
    }
    return std::get<HttpResponse>(next);
  }

  void enqueue_response(HttpResponse response) {
    std::lock_guard<std::mutex> lock(mutex_);
    responses_.push(std::move(response));
  }

  // The next request fails as if the connection could not be made.
  void enqueue_error(std::string message) {
    std::lock_guard<std::mutex> lock(mutex_);
    responses_.push(EnqueuedError{std::move(message)});
  }

  [[nodiscard]] const std::vector<HttpRequest>& requests() const { return requests_; }

  [[nodiscard]] std::size_t call_count() const { return requests_.size(); }

  [[nodiscard]] const HttpRequest& last_request() const { return requests_.back(); }

private:
  std::queue<Enqueued> responses_;
  std::vector<HttpRequest> requests_;
  mutable std::mutex mutex_;
};

}  // namespace costtracker::testing
