#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace costtracker::utils {

// RFC 4648 section 5 alphabet, no '=' padding.
std::string encode_base64url(const std::vector<std::uint8_t>& input);

}
