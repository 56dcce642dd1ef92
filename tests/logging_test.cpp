#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "costtracker/logging.hpp"

using costtracker::LogLevel;
using costtracker::Logger;

TEST(LoggingTest, ParsesLevelNames) {
  EXPECT_EQ(costtracker::parse_log_level("DEBUG"), LogLevel::Debug);
  EXPECT_EQ(costtracker::parse_log_level("warning"), LogLevel::Warn);
  EXPECT_EQ(costtracker::parse_log_level("off", LogLevel::Info), LogLevel::Off);
  EXPECT_EQ(costtracker::parse_log_level("verbose", LogLevel::Info), LogLevel::Info);
}

TEST(LoggingTest, FiltersBelowConfiguredLevel) {
  std::vector<std::string> messages;
  Logger logger(LogLevel::Warn, [&](LogLevel, const std::string& message, const nlohmann::json&) {
    messages.push_back(message);
  });

  logger.log(LogLevel::Debug, "debug");
  logger.log(LogLevel::Info, "info");
  logger.log(LogLevel::Warn, "warn");
  logger.log(LogLevel::Error, "error");

  ASSERT_EQ(messages.size(), 2u);
  EXPECT_EQ(messages[0], "warn");
  EXPECT_EQ(messages[1], "error");
  EXPECT_FALSE(logger.enabled(LogLevel::Off));
}

TEST(LoggingTest, DefaultLoggerIsSilent) {
  Logger logger;
  EXPECT_FALSE(logger.enabled(LogLevel::Error));
  logger.log(LogLevel::Error, "dropped");
}

TEST(LoggingTest, StreamLoggerWritesPrefixedLines) {
  std::ostringstream out;
  Logger logger(LogLevel::Debug, costtracker::make_stream_logger(out));

  logger.log(LogLevel::Info, "request succeeded", {{"status", 200}});
  logger.log(LogLevel::Warn, "plain");

  EXPECT_EQ(out.str(),
            "[cost-tracker] info: request succeeded {\"status\":200}\n"
            "[cost-tracker] warn: plain\n");
}

TEST(LoggingTest, SanitizesCredentialHeaders) {
  const auto sanitized = costtracker::sanitize_headers(
      {{"Authorization", "Bearer secret"}, {"cookie", "a=b"}, {"Accept", "application/json"}});
  EXPECT_EQ(sanitized.at("Authorization"), "***");
  EXPECT_EQ(sanitized.at("cookie"), "***");
  EXPECT_EQ(sanitized.at("Accept"), "application/json");
}
