#include "simb/core/random.h"

#include <cerrno>
#include <system_error>

#include <sys/random.h>

namespace simb::core {

void fill_random(std::span<std::uint8_t> out) {
  std::size_t filled = 0;
  while (filled < out.size()) {
    const ssize_t n = ::getrandom(out.data() + filled, out.size() - filled, 0);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw std::system_error(errno, std::generic_category(), "getrandom failed");
    }
    filled += static_cast<std::size_t>(n);
  }
}

}  // namespace simb::core
