#pragma once

#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace costtracker::utils::qs {

// RFC1738 is the form encoding (space as '+'); RFC3986 percent-encodes spaces.
enum class Format { RFC1738, RFC3986 };

using Params = std::vector<std::pair<std::string, std::string>>;

[[nodiscard]] std::string percent_encode(std::string_view input, Format format = Format::RFC3986);

/**
 * Decodes `%XX` escapes and, when `plus_as_space` is set, '+' as a space.
 * Malformed escapes are kept verbatim.
 */
[[nodiscard]] std::string percent_decode(std::string_view input, bool plus_as_space = true);

/**
 * Joins `params` as `k=v&k=v` in the given order, encoding keys and values.
 */
[[nodiscard]] std::string stringify(const Params& params, Format format = Format::RFC3986);

/**
 * Parses a query string (with or without the leading '?'). Later duplicates
 * overwrite earlier ones; a key without '=' maps to an empty value.
 */
[[nodiscard]] std::map<std::string, std::string> parse(std::string_view query);

}  // namespace costtracker::utils::qs
