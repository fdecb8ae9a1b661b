#include "vexlake/core/crc32c.hpp"

#include <array>

namespace vexlake::core {

namespace {

constexpr std::array<std::uint32_t, 256> kTable = [] {
  std::array<std::uint32_t, 256> t{};
  const std::uint32_t poly = 0x82F63B78u;
  for (std::uint32_t i = 0; i < 256; ++i) {
    std::uint32_t c = i;
    for (int k = 0; k < 8; ++k) {
      c = (c & 1u) ? (poly ^ (c >> 1)) : (c >> 1);
    }
    t[i] = c;
  }
  return t;
}();

} // namespace

auto crc32c_extend(std::uint32_t crc, std::span<const std::uint8_t> bytes) -> std::uint32_t {
  std::uint32_t c = ~crc;
  for (auto b : bytes) {
    c = kTable[(c ^ b) & 0xFFu] ^ (c >> 8);
  }
  return ~c;
}

auto crc32c(std::span<const std::uint8_t> bytes) -> std::uint32_t {
  return crc32c_extend(0u, bytes);
}

} // namespace vexlake::core
