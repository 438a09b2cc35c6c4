#include "simb/domain/contact.h"

namespace simb::domain {

nlohmann::json contact_to_json(const Contact& contact) {
  return nlohmann::json{
      {"id", contact.contact_id.value},
      {"label", contact.label},
      {"public_key", contact.public_key},
      {"fingerprint", contact.fingerprint},
      {"onion_address", contact.onion_address},
      {"mailbox_id", contact.mailbox_id},
      {"is_verified", contact.is_verified},
      {"has_session", contact.has_session},
  };
}

}  // namespace simb::domain
