#include "uuid.hpp"

#include <array>
#include <cstdint>
#include <random>

namespace datagraph::util {

std::string NewId() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  static constexpr char               kHex[] = "0123456789abcdef";

  std::array<uint8_t, 16> bytes{};
  for (auto& b : bytes)
    b = static_cast<uint8_t>(rng());

  // version 4, RFC4122 variant
  bytes[6] = (bytes[6] & 0x0F) | 0x40;
  bytes[8] = (bytes[8] & 0x3F) | 0x80;

  std::string out;
  out.reserve(36);
  for (size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) out += '-';
    out += kHex[bytes[i] >> 4];
    out += kHex[bytes[i] & 0x0F];
  }
  return out;
}

} // namespace datagraph::util
