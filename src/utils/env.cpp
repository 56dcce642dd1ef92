#include "costtracker/utils/env.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace costtracker::utils {
namespace {

std::string trim(std::string value) {
  auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  auto begin = std::find_if_not(value.begin(), value.end(), is_space);
  auto end = std::find_if_not(value.rbegin(), value.rend(), is_space).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

}  // namespace

std::optional<std::string> read_env(const std::string& name) {
  const char* raw = std::getenv(name.c_str());
  if (!raw) {
    return std::nullopt;
  }
  return trim(raw);
}

std::optional<std::string> read_first_env(std::initializer_list<const char*> names) {
  for (const char* name : names) {
    if (auto value = read_env(name); value && !value->empty()) {
      return value;
    }
  }
  return std::nullopt;
}

}  // namespace costtracker::utils
