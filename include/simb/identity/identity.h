#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace simb::identity {

constexpr std::size_t kPublicKeySize = 32;
constexpr std::size_t kSecretKeySize = 64;

using PublicKey = std::array<std::uint8_t, kPublicKeySize>;
// Ed25519 secret key in the 64-byte seed||public_key layout.
using SecretKey = std::array<std::uint8_t, kSecretKeySize>;

// Identity is an Ed25519 key pair, or a public key alone when imported from export data.
// The fingerprint is derived from the public key at construction and never changes.
// Secret key material is wiped on destruction. Move-only.
class Identity {
 public:
  // Public key only.
  explicit Identity(const PublicKey& public_key);
  // Copies the secret key; the caller still owns and wipes its buffer.
  Identity(const PublicKey& public_key, const SecretKey& secret_key);
  ~Identity();

  Identity(const Identity&) = delete;
  Identity& operator=(const Identity&) = delete;
  Identity(Identity&& other) noexcept;
  Identity& operator=(Identity&& other) noexcept;

  [[nodiscard]] const PublicKey& public_key() const { return public_key_; }
  [[nodiscard]] std::string public_key_hex() const;
  [[nodiscard]] const std::string& fingerprint_hex() const { return fingerprint_hex_; }

  [[nodiscard]] bool has_secret_key() const { return has_secret_key_; }

  // Throws std::logic_error for a public-key-only identity.
  [[nodiscard]] const SecretKey& secret_key() const;

 private:
  void wipe();

  PublicKey public_key_{};
  SecretKey secret_key_{};
  bool has_secret_key_{false};
  std::string fingerprint_hex_;
};

// fingerprint_hex returns the 64-character BLAKE2b-256 digest of a public key.
[[nodiscard]] std::string fingerprint_hex(const PublicKey& public_key);

}  // namespace simb::identity
