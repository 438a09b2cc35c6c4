#include "simb/core/id_generator.h"

#include "simb/core/hex.h"
#include "simb/core/random.h"

#include <array>
#include <cstdint>

namespace simb::core {

std::string UuidIdGenerator::next(std::string_view prefix) {
  std::array<std::uint8_t, 16> bytes{};
  fill_random(bytes);
  bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
  bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

  const std::string hex = to_hex(bytes);
  std::string uuid = hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
                     hex.substr(16, 4) + "-" + hex.substr(20, 12);
  if (prefix.empty()) {
    return uuid;
  }
  return std::string(prefix) + "-" + uuid;
}

std::string DeterministicIdGenerator::next(std::string_view prefix) {
  const auto c = counter_.fetch_add(1, std::memory_order_relaxed);
  if (prefix.empty()) {
    return std::to_string(c);
  }
  return std::string(prefix) + "-" + std::to_string(c);
}

}  // namespace simb::core
