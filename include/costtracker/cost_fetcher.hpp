#pragma once

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

#include "costtracker/config.hpp"
#include "costtracker/http_client.hpp"
#include "costtracker/logging.hpp"

namespace costtracker {

struct CostFetcherOptions {
  std::string management_endpoint = kDefaultManagementEndpoint;
  std::string api_version = kDefaultApiVersion;
  std::chrono::milliseconds timeout{60000};
};

class CostFetcher {
public:
  explicit CostFetcher(HttpClient& http, CostFetcherOptions options = {}, Logger logger = {});

  /**
   * Issues one GET against the Consumption usageDetails endpoint and returns
   * the parsed body. Throws FetchError on a non-2xx status (body left
   * unparsed), ConnectionError when no response arrives, and ParseError when a
   * 2xx body is not a JSON object. No retry, no caching, no nextLink follow.
   */
  nlohmann::json fetch_usage(const std::string& token, const std::string& subscription_id) const;

  std::string usage_url(const std::string& subscription_id) const;

private:
  HttpClient& http_;
  CostFetcherOptions options_;
  Logger logger_;
};

}  // namespace costtracker
