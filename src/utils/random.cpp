#include "costtracker/utils/random.hpp"

#include <random>

namespace costtracker::utils {
namespace {

unsigned char random_byte() {
  static thread_local std::random_device rd;
  return static_cast<unsigned char>(rd() & 0xFF);
}

}  // namespace

std::vector<std::uint8_t> random_bytes(std::size_t count) {
  std::vector<std::uint8_t> data(count);
  for (auto& byte : data) {
    byte = random_byte();
  }
  return data;
}

}  // namespace costtracker::utils
