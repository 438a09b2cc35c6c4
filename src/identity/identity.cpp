#include "simb/identity/identity.h"

#include "simb/core/hex.h"

#include <monocypher.h>

#include <stdexcept>

namespace simb::identity {

Identity::Identity(const PublicKey& public_key)
    : public_key_(public_key), fingerprint_hex_(identity::fingerprint_hex(public_key)) {}

Identity::Identity(const PublicKey& public_key, const SecretKey& secret_key)
    : public_key_(public_key),
      secret_key_(secret_key),
      has_secret_key_(true),
      fingerprint_hex_(identity::fingerprint_hex(public_key)) {}

Identity::~Identity() {
  wipe();
}

Identity::Identity(Identity&& other) noexcept
    : public_key_(other.public_key_),
      secret_key_(other.secret_key_),
      has_secret_key_(other.has_secret_key_),
      fingerprint_hex_(std::move(other.fingerprint_hex_)) {
  other.wipe();
}

Identity& Identity::operator=(Identity&& other) noexcept {
  if (this != &other) {
    wipe();
    public_key_ = other.public_key_;
    secret_key_ = other.secret_key_;
    has_secret_key_ = other.has_secret_key_;
    fingerprint_hex_ = std::move(other.fingerprint_hex_);
    other.wipe();
  }
  return *this;
}

std::string Identity::public_key_hex() const {
  return core::to_hex(public_key_);
}

const SecretKey& Identity::secret_key() const {
  if (!has_secret_key_) {
    throw std::logic_error("identity has no secret key");
  }
  return secret_key_;
}

void Identity::wipe() {
  crypto_wipe(secret_key_.data(), secret_key_.size());
  has_secret_key_ = false;
}

std::string fingerprint_hex(const PublicKey& public_key) {
  std::array<std::uint8_t, 32> digest{};
  crypto_blake2b(digest.data(), digest.size(), public_key.data(), public_key.size());
  return core::to_hex(digest);
}

}  // namespace simb::identity
