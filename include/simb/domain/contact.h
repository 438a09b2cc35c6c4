#pragma once

#include <nlohmann/json.hpp>

#include <string>

#include "simb/core/ids.h"

namespace simb::domain {

// Contact is a peer the user can message. Trust is established only by the user
// verifying the fingerprint out of band; is_verified is never set automatically.
struct Contact {
  core::ContactId contact_id;
  std::string label;
  std::string public_key;   // hex
  std::string fingerprint;  // hex, derived from public_key
  std::string onion_address;
  std::string mailbox_id;
  bool is_verified{false};
  bool has_session{false};
};

// Wire mapping. The contact id is serialized under "id".
[[nodiscard]] nlohmann::json contact_to_json(const Contact& contact);

}  // namespace simb::domain
