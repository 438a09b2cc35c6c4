#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace simb::core {

// to_hex encodes bytes as a lower-case hexadecimal string.
[[nodiscard]] std::string to_hex(std::span<const std::uint8_t> bytes);

// from_hex decodes a hexadecimal string (either case).
// Returns nullopt on odd length or any non-hex character.
[[nodiscard]] std::optional<std::vector<std::uint8_t>> from_hex(std::string_view hex);

}  // namespace simb::core
