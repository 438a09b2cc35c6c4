#pragma once

#include "simb/identity/identity.h"

#include <string_view>

namespace simb::identity {

// IIdentityProvider creates identities. The bridge never touches key generation directly.
class IIdentityProvider {
 public:
  virtual ~IIdentityProvider() = default;

  // Generate a fresh key pair.
  [[nodiscard]] virtual Identity generate() = 0;

  // Build a public-key-only identity from 64 hex characters.
  // Throws std::invalid_argument if the input is not a 32-byte hex key.
  [[nodiscard]] virtual Identity from_public_key_hex(std::string_view hex) = 0;

 protected:
  IIdentityProvider() = default;
  IIdentityProvider(const IIdentityProvider&) = default;
  IIdentityProvider& operator=(const IIdentityProvider&) = default;
  IIdentityProvider(IIdentityProvider&&) = default;
  IIdentityProvider& operator=(IIdentityProvider&&) = default;
};

// Ed25519IdentityProvider generates Ed25519 key pairs seeded from getrandom(2).
class Ed25519IdentityProvider final : public IIdentityProvider {
 public:
  Ed25519IdentityProvider() = default;
  ~Ed25519IdentityProvider() override = default;

  Ed25519IdentityProvider(const Ed25519IdentityProvider&) = delete;
  Ed25519IdentityProvider& operator=(const Ed25519IdentityProvider&) = delete;
  Ed25519IdentityProvider(Ed25519IdentityProvider&&) = delete;
  Ed25519IdentityProvider& operator=(Ed25519IdentityProvider&&) = delete;

  [[nodiscard]] Identity generate() override;
  [[nodiscard]] Identity from_public_key_hex(std::string_view hex) override;
};

}  // namespace simb::identity
