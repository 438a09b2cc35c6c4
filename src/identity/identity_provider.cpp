#include "simb/identity/identity_provider.h"

#include "simb/core/hex.h"
#include "simb/core/random.h"

#include <monocypher-ed25519.h>
#include <monocypher.h>

#include <algorithm>
#include <stdexcept>
#include <string>

namespace simb::identity {

Identity Ed25519IdentityProvider::generate() {
  std::array<std::uint8_t, 32> seed{};
  core::fill_random(seed);

  SecretKey secret_key{};
  PublicKey public_key{};
  // Wipes the seed.
  crypto_ed25519_key_pair(secret_key.data(), public_key.data(), seed.data());

  Identity identity(public_key, secret_key);
  crypto_wipe(secret_key.data(), secret_key.size());
  return identity;
}

Identity Ed25519IdentityProvider::from_public_key_hex(std::string_view hex) {
  const auto bytes = core::from_hex(hex);
  if (!bytes.has_value() || bytes->size() != kPublicKeySize) {
    throw std::invalid_argument("public_key must be " + std::to_string(kPublicKeySize * 2) +
                                " hex characters");
  }

  PublicKey public_key{};
  std::copy(bytes->begin(), bytes->end(), public_key.begin());
  return Identity(public_key);
}

}  // namespace simb::identity
