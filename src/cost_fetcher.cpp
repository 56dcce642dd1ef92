#include "costtracker/cost_fetcher.hpp"

#include "costtracker/error.hpp"
#include "costtracker/utils/qs.hpp"
#include "costtracker/utils/values.hpp"

#include <utility>

namespace costtracker {
namespace {

using json = nlohmann::json;

nlohmann::json build_request_log_details(const HttpRequest& request) {
  nlohmann::json details;
  details["method"] = request.method;
  details["url"] = request.url;
  details["headers"] = sanitize_headers(request.headers);
  return details;
}

nlohmann::json build_response_log_details(const HttpRequest& request,
                                          const HttpResponse& response,
                                          std::chrono::steady_clock::duration duration) {
  nlohmann::json details = build_request_log_details(request);
  details["status"] = response.status_code;
  details["duration_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
  details["response_headers"] = sanitize_headers(response.headers);
  return details;
}

}  // namespace

CostFetcher::CostFetcher(HttpClient& http, CostFetcherOptions options, Logger logger)
    : http_(http), options_(std::move(options)), logger_(std::move(logger)) {}

std::string CostFetcher::usage_url(const std::string& subscription_id) const {
  utils::qs::Params query = {{"api-version", options_.api_version}};
  return utils::strip_trailing_slashes(options_.management_endpoint) + "/subscriptions/" +
         utils::qs::percent_encode(subscription_id) + "/providers/Microsoft.Consumption/usageDetails?" +
         utils::qs::stringify(query);
}

nlohmann::json CostFetcher::fetch_usage(const std::string& token, const std::string& subscription_id) const {
  HttpRequest request;
  request.method = "GET";
  request.url = usage_url(subscription_id);
  request.headers["Authorization"] = "Bearer " + token;
  request.timeout = options_.timeout;

  logger_.log(LogLevel::Debug, "sending request", build_request_log_details(request));
  const auto start_time = std::chrono::steady_clock::now();

  HttpResponse response;
  try {
    response = http_.request(request);
  } catch (const ConnectionError& error) {
    logger_.log(LogLevel::Error, "request failed", {{"url", request.url}, {"error", error.what()}});
    throw;
  }

  const auto duration = std::chrono::steady_clock::now() - start_time;
  if (!is_success_status(response.status_code)) {
    logger_.log(LogLevel::Error, "request failed", build_response_log_details(request, response, duration));
    throw FetchError("HTTP " + std::to_string(response.status_code) + " from usage endpoint", response.status_code,
                     std::move(response.body), std::move(response.headers));
  }
  logger_.log(LogLevel::Info, "request succeeded", build_response_log_details(request, response, duration));

  json payload;
  try {
    payload = json::parse(response.body);
  } catch (const json::exception& ex) {
    throw ParseError(std::string("Failed to parse usage response: ") + ex.what());
  }
  if (!payload.is_object()) {
    throw ParseError(std::string("Failed to parse usage response: expected a JSON object, got ") +
                     payload.type_name());
  }

  if (auto next_link = payload.find("nextLink"); next_link != payload.end() && next_link->is_string()) {
    logger_.log(LogLevel::Warn, "usage response has more pages, only the first page is shown",
                {{"next_link", next_link->get<std::string>()}});
  }
  return payload;
}

}  // namespace costtracker
