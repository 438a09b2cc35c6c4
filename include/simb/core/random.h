#pragma once

#include <cstdint>
#include <span>

namespace simb::core {

// fill_random fills out with bytes from the kernel CSPRNG (getrandom(2)).
// Throws std::system_error if the kernel refuses the request.
void fill_random(std::span<std::uint8_t> out);

}  // namespace simb::core
