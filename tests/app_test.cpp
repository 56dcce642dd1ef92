#include <gtest/gtest.h>

#include <chrono>
#include <sstream>
#include <string>

#include "costtracker/app.hpp"
#include "costtracker/cancellation.hpp"
#include "support/fake_sign_in.hpp"
#include "support/mock_http_client.hpp"

namespace ctt = costtracker::testing;

using costtracker::ExitCode;
using costtracker::HttpResponse;

namespace {

class ApplicationTest : public ::testing::Test {
protected:
  ApplicationTest() {
    config_.client_id = "client";
    config_.tenant_id = "tenant";
    config_.subscription_id = "sub-1";
  }

  int run(const costtracker::CancellationToken& cancel = {}) {
    costtracker::Application app(config_, http_, browser_, ctt::scripted_receivers(script_));
    return app.run(out_, err_, cancel);
  }

  costtracker::Config config_;
  ctt::MockHttpClient http_;
  ctt::SignInScript script_;
  ctt::RecordingBrowserLauncher browser_{script_};
  std::ostringstream out_;
  std::ostringstream err_;
};

constexpr int code(ExitCode value) {
  return static_cast<int>(value);
}

}  // namespace

TEST_F(ApplicationTest, PrintsCostTableAfterSignIn) {
  http_.enqueue_response(ctt::token_response("tok"));
  http_.enqueue_response(HttpResponse{200, {}, R"({"value": [
    {"properties": {"usageStart": "2024-03-01T00:00:00Z", "pretaxCost": 1.5}},
    {"properties": {"usageStart": "2024-03-02T00:00:00Z", "pretaxCost": 2}}
  ]})"});

  EXPECT_EQ(run(), code(ExitCode::Success));
  EXPECT_EQ(out_.str(), "Date\t\tCost\n---------------------\n2024-03-01\t1.5\n2024-03-02\t2\n");
  EXPECT_NE(err_.str().find("oauth2/v2.0/authorize?"), std::string::npos);

  ASSERT_EQ(http_.call_count(), 2u);
  EXPECT_EQ(http_.requests()[1].headers.at("Authorization"), "Bearer tok");
  EXPECT_NE(http_.requests()[1].url.find("/subscriptions/sub-1/"), std::string::npos);
}

TEST_F(ApplicationTest, TokenIsHiddenUnlessRequested) {
  http_.enqueue_response(ctt::token_response("secret-token"));
  http_.enqueue_response(HttpResponse{200, {}, R"({"value": []})"});
  EXPECT_EQ(run(), code(ExitCode::Success));
  EXPECT_EQ(out_.str().find("secret-token"), std::string::npos);
  EXPECT_EQ(err_.str().find("secret-token"), std::string::npos);
}

TEST_F(ApplicationTest, ShowTokenPrintsTokenBeforeTable) {
  config_.show_token = true;
  http_.enqueue_response(ctt::token_response("visible-token"));
  http_.enqueue_response(HttpResponse{200, {}, R"({"value": []})"});

  EXPECT_EQ(run(), code(ExitCode::Success));
  EXPECT_EQ(out_.str(),
            "\nAccess Token:\n\nvisible-token\n\n---------------------\n\n"
            "Date\t\tCost\n---------------------\nNo cost data found.\n");
}

TEST_F(ApplicationTest, OutOfRangeConfigStopsBeforeSignIn) {
  config_.login_timeout = std::chrono::seconds(10000000000000000LL);

  EXPECT_EQ(run(), code(ExitCode::ConfigFailure));
  EXPECT_TRUE(script_.opened_urls.empty());
  EXPECT_EQ(http_.call_count(), 0u);
  EXPECT_NE(err_.str().find("Configuration error: login_timeout"), std::string::npos);
}

TEST_F(ApplicationTest, AuthFailureSkipsFetch) {
  script_.respond = [](const ctt::QueryParams& params) {
    costtracker::AuthorizationResponse response;
    response.error = "access_denied";
    response.state = params.at("state");
    return response;
  };

  EXPECT_EQ(run(), code(ExitCode::AuthFailure));
  EXPECT_EQ(http_.call_count(), 0u);
  EXPECT_TRUE(out_.str().empty());
  EXPECT_NE(err_.str().find("Authentication failed: Sign-in failed: access_denied"), std::string::npos);
}

TEST_F(ApplicationTest, CancelledSignInExitsWithAuthFailure) {
  costtracker::CancellationSource source;
  source.cancel();
  EXPECT_EQ(run(source.token()), code(ExitCode::AuthFailure));
  EXPECT_NE(err_.str().find("Sign-in was cancelled"), std::string::npos);
  EXPECT_EQ(http_.call_count(), 0u);
}

TEST_F(ApplicationTest, FetchFailurePrintsStatusAndBody) {
  http_.enqueue_response(ctt::token_response("tok"));
  http_.enqueue_response(HttpResponse{403, {}, R"({"error":{"code":"AuthorizationFailed"}})"});

  EXPECT_EQ(run(), code(ExitCode::FetchFailure));
  EXPECT_EQ(out_.str(), "Error: 403 Forbidden\nDetails: {\"error\":{\"code\":\"AuthorizationFailed\"}}\n");
  EXPECT_EQ(out_.str().find("Date"), std::string::npos);
}

TEST_F(ApplicationTest, LegacyExitStatusReportsSuccessOnFetchFailure) {
  config_.legacy_exit_status = true;
  http_.enqueue_response(ctt::token_response("tok"));
  http_.enqueue_response(HttpResponse{500, {}, "oops"});

  EXPECT_EQ(run(), code(ExitCode::Success));
  EXPECT_EQ(out_.str(), "Error: 500 Internal Server Error\nDetails: oops\n");
}

TEST_F(ApplicationTest, ConnectionFailureIsFetchFailure) {
  http_.enqueue_response(ctt::token_response("tok"));
  http_.enqueue_error("Couldn't connect to server");

  EXPECT_EQ(run(), code(ExitCode::FetchFailure));
  EXPECT_EQ(out_.str(), "Error: Couldn't connect to server\n");
}

TEST_F(ApplicationTest, MalformedSuccessBodyIsParseFailure) {
  http_.enqueue_response(ctt::token_response("tok"));
  http_.enqueue_response(HttpResponse{200, {}, "{\"value\": ["});

  EXPECT_EQ(run(), code(ExitCode::ParseFailure));
  EXPECT_TRUE(out_.str().empty());
  EXPECT_NE(err_.str().find("Failed to parse usage response"), std::string::npos);
}

TEST_F(ApplicationTest, NonArrayValuePrintsNoData) {
  http_.enqueue_response(ctt::token_response("tok"));
  http_.enqueue_response(HttpResponse{200, {}, R"({"value": "unexpected"})"});

  EXPECT_EQ(run(), code(ExitCode::Success));
  EXPECT_EQ(out_.str(), "Date\t\tCost\n---------------------\nNo cost data found.\n");
}
