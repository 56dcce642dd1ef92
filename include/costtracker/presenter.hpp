#pragma once

#include <ostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "costtracker/error.hpp"
#include "costtracker/usage.hpp"

namespace costtracker {

inline constexpr const char* kHeaderLine = "Date\t\tCost";
inline constexpr const char* kSeparatorLine = "---------------------";
inline constexpr const char* kNoDataLine = "No cost data found.";
inline constexpr const char* kInvalidRecordLine = "Invalid or missing data in response.";

/**
 * Header and separator, then one line per record in server order, or the
 * no-data line when there are no records.
 */
std::vector<std::string> render_lines(const UsageReport& report);

std::vector<std::string> render_lines(const nlohmann::json& document);

// "Forbidden" for 403 and so on. Empty for codes without a standard phrase.
std::string reason_phrase(long status_code);

class CostPresenter {
public:
  explicit CostPresenter(std::ostream& out) : out_(out) {}

  void render(const nlohmann::json& document) const;
  void render(const UsageReport& report) const;

  // Status and raw body of a failed fetch, or the transport message.
  void render_fetch_error(const FetchError& error) const;

  void render_token(const std::string& token) const;

private:
  std::ostream& out_;
};

}  // namespace costtracker
