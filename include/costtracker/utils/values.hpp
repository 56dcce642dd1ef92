#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace costtracker::utils {

bool is_absolute_url(std::string_view url);

std::string strip_trailing_slashes(std::string url);

std::optional<nlohmann::json> safe_json(const std::string& text);

bool has_own(const nlohmann::json& object, const std::string& key);

/**
 * Text of a scalar JSON value: strings verbatim, numbers and booleans in their
 * JSON spelling. Null, objects and arrays yield std::nullopt.
 */
std::optional<std::string> scalar_text(const nlohmann::json& value);

/**
 * Accepts 1/0, true/false, yes/no and on/off in any case. Anything else
 * yields std::nullopt.
 */
std::optional<bool> maybe_coerce_boolean(std::string_view value);

/**
 * Parses a base-10 non-negative integer that fills the whole string.
 */
std::optional<std::int64_t> maybe_coerce_non_negative(std::string_view value);

}  // namespace costtracker::utils
