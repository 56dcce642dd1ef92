#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace costtracker {

/**
 * One element of the usageDetails `value` array. A field is std::nullopt when
 * the key is missing, null, or not a scalar, or when `properties` itself is
 * missing or not an object.
 */
struct UsageRecord {
  std::optional<std::string> usage_start;
  std::optional<std::string> pretax_cost;

  // usage_start up to the first 'T'.
  std::optional<std::string> date() const;

  bool complete() const { return usage_start.has_value() && pretax_cost.has_value(); }
};

struct UsageReport {
  std::vector<UsageRecord> records;
  // Continuation link of a multi-page result. Reported, never followed.
  std::optional<std::string> next_link;
  // `value` was present but not an array.
  bool value_malformed = false;
};

// Prefix of an ISO-8601 timestamp before the first 'T', or the whole input.
std::string date_part(std::string_view timestamp);

std::optional<std::string> usage_property(const nlohmann::json& entry, const char* name);

UsageRecord parse_usage_record(const nlohmann::json& entry);

UsageReport parse_usage_report(const nlohmann::json& document);

}  // namespace costtracker
