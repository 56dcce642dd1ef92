#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace costtracker::utils {

class SHA256 {
public:
  SHA256() { reset(); }

  void reset();
  void update(const std::uint8_t* data, std::size_t size);
  std::vector<std::uint8_t> digest();

private:
  void process_block(const std::uint8_t* block);

  std::uint32_t state_[8]{};
  std::uint64_t bit_length_ = 0;
  std::size_t buffer_size_ = 0;
  std::array<std::uint8_t, 64> buffer_{};
};

std::vector<std::uint8_t> sha256(std::string_view data);

}  // namespace costtracker::utils
