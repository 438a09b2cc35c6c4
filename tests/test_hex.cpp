#include "simb/core/hex.h"

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <cstdint>

using namespace simb::core;

TEST_CASE("to_hex encodes lower-case", "[hex]") {
  const std::array<std::uint8_t, 4> bytes{0x00, 0x0f, 0xab, 0xff};
  CHECK(to_hex(bytes) == "000fabff");
  CHECK(to_hex(std::span<const std::uint8_t>{}).empty());
}

TEST_CASE("from_hex accepts either case", "[hex]") {
  const auto bytes = from_hex("00Fab1");
  REQUIRE(bytes.has_value());
  REQUIRE(bytes->size() == 3);
  CHECK((*bytes)[0] == 0x00);
  CHECK((*bytes)[1] == 0xfa);
  CHECK((*bytes)[2] == 0xb1);
}

TEST_CASE("from_hex rejects malformed input", "[hex]") {
  CHECK_FALSE(from_hex("abc").has_value());
  CHECK_FALSE(from_hex("zz").has_value());
  CHECK_FALSE(from_hex("0x12").has_value());
}
