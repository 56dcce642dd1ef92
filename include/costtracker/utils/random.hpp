#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace costtracker::utils {

/**
 * Returns `count` bytes from std::random_device, which is backed by the
 * operating system's CSPRNG on the supported platforms.
 */
std::vector<std::uint8_t> random_bytes(std::size_t count);

}  // namespace costtracker::utils
