#pragma once

#include "simb/core/result.h"
#include "simb/identity/identity.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace simb::identity {

// IKeyStore persists one identity encrypted under a passphrase.
class IKeyStore {
 public:
  virtual ~IKeyStore() = default;

  // Overwrites any previously stored identity.
  // Throws std::invalid_argument if identity has no secret key.
  [[nodiscard]] virtual core::Result<bool, core::KeyStoreError> save(
      const Identity& identity, std::string_view passphrase) = 0;

  [[nodiscard]] virtual core::Result<Identity, core::KeyStoreError> load(
      std::string_view passphrase) const = 0;

 protected:
  IKeyStore() = default;
  IKeyStore(const IKeyStore&) = default;
  IKeyStore& operator=(const IKeyStore&) = default;
  IKeyStore(IKeyStore&&) = default;
  IKeyStore& operator=(IKeyStore&&) = default;
};

// Argon2i memory cost bounds, in KiB blocks. A keystore outside them is corrupt.
constexpr std::uint32_t kMinKdfBlocks = 8;
constexpr std::uint32_t kMaxKdfBlocks = 1U << 22;

// Argon2i cost parameters. nb_blocks is in KiB.
struct KdfParams {
  std::uint32_t nb_blocks{65536};
  std::uint32_t nb_passes{3};
};

// FileKeyStore seals the secret key with XChaCha20-Poly1305 under an Argon2i-derived key
// and stores it as a JSON document. Writes go to a sibling temp file and are renamed into place.
//
// File layout:
//   {"version":1,
//    "kdf":{"algorithm":"argon2i","nb_blocks":N,"nb_passes":P,"salt":hex},
//    "cipher":"xchacha20-poly1305","nonce":hex,"mac":hex,"ciphertext":hex,
//    "public_key":hex}
// The public key is bound as associated data.
class FileKeyStore final : public IKeyStore {
 public:
  explicit FileKeyStore(std::filesystem::path path, KdfParams kdf = {});

  [[nodiscard]] core::Result<bool, core::KeyStoreError> save(const Identity& identity,
                                                            std::string_view passphrase) override;
  [[nodiscard]] core::Result<Identity, core::KeyStoreError> load(
      std::string_view passphrase) const override;

  [[nodiscard]] const std::filesystem::path& path() const { return path_; }

 private:
  std::filesystem::path path_;
  KdfParams kdf_;
};

// keystore_error_message returns the user-facing description of a keystore failure.
[[nodiscard]] std::string keystore_error_message(core::KeyStoreError error);

}  // namespace simb::identity
