#pragma once

#include <initializer_list>
#include <optional>
#include <string>

namespace costtracker::utils {

/**
 * Reads an environment variable and trims leading/trailing whitespace.
 * Returns std::nullopt when the variable is not set.
 */
std::optional<std::string> read_env(const std::string& name);

/**
 * Returns the first of `names` that is set to a non-empty value.
 */
std::optional<std::string> read_first_env(std::initializer_list<const char*> names);

}  // namespace costtracker::utils
