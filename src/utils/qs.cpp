#include "costtracker/utils/qs.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace costtracker::utils::qs {

namespace {

bool is_unreserved(unsigned char c) {
  if (std::isalnum(c) != 0) {
    return true;
  }
  switch (c) {
    case '-':
    case '_':
    case '.':
    case '~':
      return true;
    default:
      return false;
  }
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

std::string percent_encode(std::string_view input, Format format) {
  std::ostringstream encoded;
  encoded << std::uppercase << std::hex;

  for (unsigned char byte : input) {
    if (is_unreserved(byte)) {
      encoded << static_cast<char>(byte);
      continue;
    }
    if (byte == ' ' && format == Format::RFC1738) {
      encoded << '+';
      continue;
    }

    encoded << '%';
    encoded << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }

  return encoded.str();
}

std::string percent_decode(std::string_view input, bool plus_as_space) {
  std::string decoded;
  decoded.reserve(input.size());
  for (std::size_t i = 0; i < input.size(); ++i) {
    const char c = input[i];
    if (c == '+' && plus_as_space) {
      decoded.push_back(' ');
      continue;
    }
    if (c == '%' && i + 2 < input.size()) {
      const int high = hex_value(input[i + 1]);
      const int low = hex_value(input[i + 2]);
      if (high >= 0 && low >= 0) {
        decoded.push_back(static_cast<char>((high << 4) | low));
        i += 2;
        continue;
      }
    }
    decoded.push_back(c);
  }
  return decoded;
}

std::string stringify(const Params& params, Format format) {
  std::string out;
  for (const auto& [key, value] : params) {
    if (!out.empty()) {
      out.push_back('&');
    }
    out += percent_encode(key, format);
    out.push_back('=');
    out += percent_encode(value, format);
  }
  return out;
}

std::map<std::string, std::string> parse(std::string_view query) {
  std::map<std::string, std::string> result;
  if (!query.empty() && query.front() == '?') {
    query.remove_prefix(1);
  }
  while (!query.empty()) {
    const auto amp = query.find('&');
    std::string_view pair = query.substr(0, amp);
    query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);
    if (pair.empty()) {
      continue;
    }
    const auto eq = pair.find('=');
    if (eq == std::string_view::npos) {
      result[percent_decode(pair)] = std::string();
    } else {
      result[percent_decode(pair.substr(0, eq))] = percent_decode(pair.substr(eq + 1));
    }
  }
  return result;
}

}  // namespace costtracker::utils::qs
