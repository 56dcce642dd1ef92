#include "costtracker/usage.hpp"

#include "costtracker/utils/values.hpp"

namespace costtracker {

std::string date_part(std::string_view timestamp) {
  return std::string(timestamp.substr(0, timestamp.find('T')));
}

std::optional<std::string> UsageRecord::date() const {
  if (!usage_start) {
    return std::nullopt;
  }
  return date_part(*usage_start);
}

std::optional<std::string> usage_property(const nlohmann::json& entry, const char* name) {
  if (!entry.is_object()) {
    return std::nullopt;
  }
  auto properties = entry.find("properties");
  if (properties == entry.end() || !properties->is_object()) {
    return std::nullopt;
  }
  auto field = properties->find(name);
  if (field == properties->end()) {
    return std::nullopt;
  }
  return utils::scalar_text(*field);
}

UsageRecord parse_usage_record(const nlohmann::json& entry) {
  UsageRecord record;
  record.usage_start = usage_property(entry, "usageStart");
  record.pretax_cost = usage_property(entry, "pretaxCost");
  return record;
}

UsageReport parse_usage_report(const nlohmann::json& document) {
  UsageReport report;
  if (!document.is_object()) {
    return report;
  }

  auto next_link = document.find("nextLink");
  if (next_link != document.end() && next_link->is_string() && !next_link->get_ref<const std::string&>().empty()) {
    report.next_link = next_link->get<std::string>();
  }

  auto value = document.find("value");
  if (value == document.end() || value->is_null()) {
    return report;
  }
  if (!value->is_array()) {
    report.value_malformed = true;
    return report;
  }

  report.records.reserve(value->size());
  for (const auto& entry : *value) {
    report.records.push_back(parse_usage_record(entry));
  }
  return report;
}

}  // namespace costtracker
