#include "costtracker/presenter.hpp"

#include <map>

namespace costtracker {

std::vector<std::string> render_lines(const UsageReport& report) {
  std::vector<std::string> lines = {kHeaderLine, kSeparatorLine};
  if (report.records.empty()) {
    lines.emplace_back(kNoDataLine);
    return lines;
  }

  lines.reserve(report.records.size() + 2);
  for (const auto& record : report.records) {
    auto date = record.date();
    if (date && record.pretax_cost) {
      lines.push_back(*date + "\t" + *record.pretax_cost);
    } else {
      lines.emplace_back(kInvalidRecordLine);
    }
  }
  return lines;
}

std::vector<std::string> render_lines(const nlohmann::json& document) {
  return render_lines(parse_usage_report(document));
}

std::string reason_phrase(long status_code) {
  static const std::map<long, std::string> kPhrases = {
      {400, "Bad Request"},
      {401, "Unauthorized"},
      {403, "Forbidden"},
      {404, "Not Found"},
      {405, "Method Not Allowed"},
      {408, "Request Timeout"},
      {409, "Conflict"},
      {422, "Unprocessable Entity"},
      {429, "Too Many Requests"},
      {500, "Internal Server Error"},
      {502, "Bad Gateway"},
      {503, "Service Unavailable"},
      {504, "Gateway Timeout"},
  };
  auto it = kPhrases.find(status_code);
  return it == kPhrases.end() ? std::string() : it->second;
}

void CostPresenter::render(const nlohmann::json& document) const {
  render(parse_usage_report(document));
}

void CostPresenter::render(const UsageReport& report) const {
  for (const auto& line : render_lines(report)) {
    out_ << line << '\n';
  }
  out_.flush();
}

void CostPresenter::render_fetch_error(const FetchError& error) const {
  if (error.status_code() == 0) {
    out_ << "Error: " << error.what() << '\n';
    out_.flush();
    return;
  }
  out_ << "Error: " << error.status_code();
  const std::string phrase = reason_phrase(error.status_code());
  if (!phrase.empty()) {
    out_ << ' ' << phrase;
  }
  out_ << '\n';
  out_ << "Details: " << error.body() << '\n';
  out_.flush();
}

void CostPresenter::render_token(const std::string& token) const {
  out_ << "\nAccess Token:\n\n" << token << "\n\n" << kSeparatorLine << "\n\n";
  out_.flush();
}

}  // namespace costtracker
