#include "simb/identity/keystore.h"

#include "simb/core/hex.h"
#include "simb/core/random.h"

#include <nlohmann/json.hpp>

#include <monocypher.h>

#include <algorithm>
#include <array>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace simb::identity {

using json = nlohmann::json;

namespace {

constexpr int kFormatVersion = 1;
constexpr std::size_t kSaltSize = 16;
constexpr std::size_t kNonceSize = 24;
constexpr std::size_t kMacSize = 16;
constexpr std::size_t kKeySize = 32;

using Key = std::array<std::uint8_t, kKeySize>;

Key derive_key(std::string_view passphrase, std::span<const std::uint8_t> salt,
               const KdfParams& kdf) {
  std::vector<std::uint8_t> work_area(static_cast<std::size_t>(kdf.nb_blocks) * 1024);

  crypto_argon2_config config;
  config.algorithm = CRYPTO_ARGON2_I;
  config.nb_blocks = kdf.nb_blocks;
  config.nb_passes = kdf.nb_passes;
  config.nb_lanes = 1;

  crypto_argon2_inputs inputs;
  inputs.pass = reinterpret_cast<const std::uint8_t*>(passphrase.data());
  inputs.salt = salt.data();
  inputs.pass_size = static_cast<std::uint32_t>(passphrase.size());
  inputs.salt_size = static_cast<std::uint32_t>(salt.size());

  Key key{};
  crypto_argon2(key.data(), static_cast<std::uint32_t>(key.size()), work_area.data(), config,
                inputs, crypto_argon2_no_extras);
  crypto_wipe(work_area.data(), work_area.size());
  return key;
}

// Decodes a hex field of an exact size; nullopt when absent, malformed, or the wrong length.
std::optional<std::vector<std::uint8_t>> hex_field(const json& doc, const char* name,
                                                   std::size_t expected_size) {
  if (!doc.contains(name) || !doc[name].is_string()) {
    return std::nullopt;
  }
  auto bytes = core::from_hex(doc[name].get<std::string>());
  if (!bytes.has_value() || (expected_size != 0 && bytes->size() != expected_size)) {
    return std::nullopt;
  }
  return bytes;
}

}  // namespace

FileKeyStore::FileKeyStore(std::filesystem::path path, KdfParams kdf)
    : path_(std::move(path)), kdf_(kdf) {}

core::Result<bool, core::KeyStoreError> FileKeyStore::save(const Identity& identity,
                                                           std::string_view passphrase) {
  if (!identity.has_secret_key()) {
    throw std::invalid_argument("cannot store an identity without a secret key");
  }

  std::array<std::uint8_t, kSaltSize> salt{};
  std::array<std::uint8_t, kNonceSize> nonce{};
  core::fill_random(salt);
  core::fill_random(nonce);

  Key key = derive_key(passphrase, salt, kdf_);

  const SecretKey& plain = identity.secret_key();
  const PublicKey& public_key = identity.public_key();
  std::array<std::uint8_t, kSecretKeySize> cipher{};
  std::array<std::uint8_t, kMacSize> mac{};
  crypto_aead_lock(cipher.data(), mac.data(), key.data(), nonce.data(), public_key.data(),
                   public_key.size(), plain.data(), plain.size());
  crypto_wipe(key.data(), key.size());

  json doc;
  doc["version"] = kFormatVersion;
  doc["kdf"] = {
      {"algorithm", "argon2i"},
      {"nb_blocks", kdf_.nb_blocks},
      {"nb_passes", kdf_.nb_passes},
      {"salt", core::to_hex(salt)},
  };
  doc["cipher"] = "xchacha20-poly1305";
  doc["nonce"] = core::to_hex(nonce);
  doc["mac"] = core::to_hex(mac);
  doc["ciphertext"] = core::to_hex(cipher);
  doc["public_key"] = identity.public_key_hex();

  std::filesystem::path tmp_path = path_;
  tmp_path += ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      return core::Result<bool, core::KeyStoreError>::err(core::KeyStoreError::kIoFailure);
    }
    out << doc.dump() << "\n";
    out.flush();
    if (!out) {
      return core::Result<bool, core::KeyStoreError>::err(core::KeyStoreError::kIoFailure);
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path_, ec);
  if (ec) {
    std::filesystem::remove(tmp_path, ec);
    return core::Result<bool, core::KeyStoreError>::err(core::KeyStoreError::kIoFailure);
  }

  return core::Result<bool, core::KeyStoreError>::ok(true);
}

core::Result<Identity, core::KeyStoreError> FileKeyStore::load(std::string_view passphrase) const {
  using LoadResult = core::Result<Identity, core::KeyStoreError>;

  std::ifstream in(path_, std::ios::binary);
  if (!in) {
    return LoadResult::err(core::KeyStoreError::kNotFound);
  }

  json doc;
  try {
    doc = json::parse(in);
  } catch (const json::parse_error&) {
    return LoadResult::err(core::KeyStoreError::kCorrupt);
  }

  if (!doc.is_object() || doc.value("version", 0) != kFormatVersion || !doc.contains("kdf") ||
      !doc["kdf"].is_object()) {
    return LoadResult::err(core::KeyStoreError::kCorrupt);
  }

  const json& kdf_doc = doc["kdf"];
  KdfParams kdf;
  try {
    kdf.nb_blocks = kdf_doc.at("nb_blocks").get<std::uint32_t>();
    kdf.nb_passes = kdf_doc.at("nb_passes").get<std::uint32_t>();
  } catch (const json::exception&) {
    return LoadResult::err(core::KeyStoreError::kCorrupt);
  }
  if (kdf.nb_blocks < kMinKdfBlocks || kdf.nb_blocks > kMaxKdfBlocks || kdf.nb_passes < 1) {
    return LoadResult::err(core::KeyStoreError::kCorrupt);
  }

  const auto salt = hex_field(kdf_doc, "salt", 0);
  const auto nonce = hex_field(doc, "nonce", kNonceSize);
  const auto mac = hex_field(doc, "mac", kMacSize);
  const auto cipher = hex_field(doc, "ciphertext", kSecretKeySize);
  const auto public_key_bytes = hex_field(doc, "public_key", kPublicKeySize);
  if (!salt || salt->empty() || !nonce || !mac || !cipher || !public_key_bytes) {
    return LoadResult::err(core::KeyStoreError::kCorrupt);
  }

  Key key = derive_key(passphrase, *salt, kdf);
  SecretKey secret_key{};
  const int rc =
      crypto_aead_unlock(secret_key.data(), mac->data(), key.data(), nonce->data(),
                         public_key_bytes->data(), public_key_bytes->size(), cipher->data(),
                         cipher->size());
  crypto_wipe(key.data(), key.size());
  if (rc != 0) {
    return LoadResult::err(core::KeyStoreError::kAuthenticationFailed);
  }

  // The secret key embeds its public half in the upper 32 bytes.
  PublicKey public_key{};
  std::copy(secret_key.begin() + kPublicKeySize, secret_key.end(), public_key.begin());
  if (!std::equal(public_key.begin(), public_key.end(), public_key_bytes->begin())) {
    crypto_wipe(secret_key.data(), secret_key.size());
    return LoadResult::err(core::KeyStoreError::kCorrupt);
  }

  Identity identity(public_key, secret_key);
  crypto_wipe(secret_key.data(), secret_key.size());
  return LoadResult::ok(std::move(identity));
}

std::string keystore_error_message(core::KeyStoreError error) {
  switch (error) {
    case core::KeyStoreError::kNotFound:
      return "No keystore found";
    case core::KeyStoreError::kAuthenticationFailed:
      return "Invalid passphrase or corrupted keystore";
    case core::KeyStoreError::kCorrupt:
      return "Keystore file is corrupt";
    case core::KeyStoreError::kIoFailure:
      return "Keystore could not be written";
  }
  return "Unknown keystore error";
}

}  // namespace simb::identity
