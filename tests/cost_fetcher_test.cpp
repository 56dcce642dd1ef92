#include <gtest/gtest.h>

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "costtracker/cost_fetcher.hpp"
#include "costtracker/error.hpp"
#include "support/mock_http_client.hpp"

namespace ctt = costtracker::testing;

using costtracker::CostFetcher;
using costtracker::HttpResponse;

namespace {

const char* kSubscription = "00000000-0000-0000-0000-000000000001";

const char* kUsageBody = R"({
  "value": [
    {"id": "u1", "properties": {"usageStart": "2024-01-01T00:00:00.0000000Z", "pretaxCost": 12.5}}
  ]
})";

}  // namespace

TEST(CostFetcherTest, SendsSingleAuthorizedGet) {
  ctt::MockHttpClient http;
  http.enqueue_response(HttpResponse{200, {}, kUsageBody});

  CostFetcher fetcher(http);
  auto document = fetcher.fetch_usage("token-abc", kSubscription);

  ASSERT_EQ(http.call_count(), 1u);
  const auto& request = http.last_request();
  EXPECT_EQ(request.method, "GET");
  EXPECT_EQ(request.url,
            "https://management.azure.com/subscriptions/00000000-0000-0000-0000-000000000001"
            "/providers/Microsoft.Consumption/usageDetails?api-version=2021-10-01");
  ASSERT_EQ(request.headers.size(), 1u);
  EXPECT_EQ(request.headers.at("Authorization"), "Bearer token-abc");
  EXPECT_TRUE(request.body.empty());

  ASSERT_TRUE(document.at("value").is_array());
  EXPECT_EQ(document.at("value").size(), 1u);
}

TEST(CostFetcherTest, HonoursEndpointApiVersionAndTimeout) {
  ctt::MockHttpClient http;
  http.enqueue_response(HttpResponse{200, {}, "{}"});

  costtracker::CostFetcherOptions options;
  options.management_endpoint = "https://management.usgovcloudapi.net/";
  options.api_version = "2023-03-01";
  options.timeout = std::chrono::milliseconds(5000);
  CostFetcher fetcher(http, options);

  EXPECT_EQ(fetcher.usage_url("sub"),
            "https://management.usgovcloudapi.net/subscriptions/sub/providers/Microsoft.Consumption/"
            "usageDetails?api-version=2023-03-01");
  fetcher.fetch_usage("t", "sub");
  EXPECT_EQ(http.last_request().timeout, std::chrono::milliseconds(5000));
}

TEST(CostFetcherTest, EncodesSubscriptionPathSegment) {
  ctt::MockHttpClient http;
  CostFetcher fetcher(http);
  EXPECT_NE(fetcher.usage_url("a/b").find("/subscriptions/a%2Fb/providers/"), std::string::npos);
}

TEST(CostFetcherTest, NonSuccessStatusKeepsRawBody) {
  ctt::MockHttpClient http;
  const std::string body = R"({"error":{"code":"AuthorizationFailed","message":"no access"}})";
  http.enqueue_response(HttpResponse{403, {{"x-ms-request-id", "r1"}}, body});

  CostFetcher fetcher(http);
  try {
    fetcher.fetch_usage("token", kSubscription);
    FAIL() << "expected FetchError";
  } catch (const costtracker::FetchError& error) {
    EXPECT_EQ(error.status_code(), 403);
    EXPECT_EQ(error.body(), body);
    EXPECT_EQ(error.headers().at("x-ms-request-id"), "r1");
  }
  EXPECT_EQ(http.call_count(), 1u);
}

TEST(CostFetcherTest, NonJsonErrorBodyIsNotAParseError) {
  ctt::MockHttpClient http;
  http.enqueue_response(HttpResponse{502, {}, "<html>Bad Gateway</html>"});

  CostFetcher fetcher(http);
  EXPECT_THROW(fetcher.fetch_usage("token", kSubscription), costtracker::FetchError);
}

TEST(CostFetcherTest, MalformedSuccessBodyIsParseError) {
  ctt::MockHttpClient http;
  http.enqueue_response(HttpResponse{200, {}, "not json"});
  http.enqueue_response(HttpResponse{200, {}, "[1,2]"});

  CostFetcher fetcher(http);
  EXPECT_THROW(fetcher.fetch_usage("token", kSubscription), costtracker::ParseError);
  EXPECT_THROW(fetcher.fetch_usage("token", kSubscription), costtracker::ParseError);
}

TEST(CostFetcherTest, ConnectionFailureHasNoStatus) {
  ctt::MockHttpClient http;
  http.enqueue_error("Could not resolve host: management.azure.com");

  CostFetcher fetcher(http);
  try {
    fetcher.fetch_usage("token", kSubscription);
    FAIL() << "expected ConnectionError";
  } catch (const costtracker::ConnectionError& error) {
    EXPECT_EQ(error.status_code(), 0);
    EXPECT_NE(std::string(error.what()).find("Could not resolve host"), std::string::npos);
  }
}

TEST(CostFetcherTest, EachCallIssuesItsOwnRequest) {
  ctt::MockHttpClient http;
  http.enqueue_response(HttpResponse{200, {}, kUsageBody});
  http.enqueue_response(HttpResponse{200, {}, kUsageBody});

  CostFetcher fetcher(http);
  fetcher.fetch_usage("token", kSubscription);
  fetcher.fetch_usage("token", kSubscription);
  EXPECT_EQ(http.call_count(), 2u);
}

TEST(CostFetcherTest, DoesNotFollowNextLink) {
  ctt::MockHttpClient http;
  http.enqueue_response(HttpResponse{200, {}, R"({"value": [], "nextLink": "https://management.azure.com/next"})"});

  std::vector<std::string> warnings;
  costtracker::Logger logger(costtracker::LogLevel::Warn,
                             [&](costtracker::LogLevel, const std::string& message, const nlohmann::json&) {
                               warnings.push_back(message);
                             });
  CostFetcher fetcher(http, {}, logger);
  auto document = fetcher.fetch_usage("token", kSubscription);

  EXPECT_EQ(http.call_count(), 1u);
  EXPECT_EQ(document.at("nextLink"), "https://management.azure.com/next");
  ASSERT_EQ(warnings.size(), 1u);
}

TEST(CostFetcherTest, DebugLogRedactsBearerToken) {
  ctt::MockHttpClient http;
  http.enqueue_response(HttpResponse{200, {}, "{}"});

  std::string logged;
  costtracker::Logger logger(costtracker::LogLevel::Debug,
                             [&](costtracker::LogLevel, const std::string&, const nlohmann::json& details) {
                               logged += details.dump();
                             });
  CostFetcher fetcher(http, {}, logger);
  fetcher.fetch_usage("super-secret", kSubscription);

  EXPECT_EQ(logged.find("super-secret"), std::string::npos);
  EXPECT_NE(logged.find("***"), std::string::npos);
}
