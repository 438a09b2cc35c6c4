#include "simb/storage/inmemory_contact_store.h"

#include <algorithm>

namespace simb::storage {

core::Result<domain::Contact, core::StorageError> InMemoryContactStore::add(
    const NewContact& contact) {
  domain::Contact stored{
      .contact_id = core::ContactId{id_gen_.next("contact")},
      .label = contact.label,
      .public_key = contact.public_key,
      .fingerprint = contact.fingerprint,
      .onion_address = contact.onion_address,
      .mailbox_id = contact.mailbox_id,
  };
  contacts_.push_back(stored);
  return core::Result<domain::Contact, core::StorageError>::ok(std::move(stored));
}

core::Result<bool, core::StorageError> InMemoryContactStore::remove(const core::ContactId& id) {
  auto it = std::find_if(contacts_.begin(), contacts_.end(),
                         [&id](const domain::Contact& c) { return c.contact_id == id; });
  if (it == contacts_.end()) {
    return core::Result<bool, core::StorageError>::err(core::StorageError::kNotFound);
  }
  contacts_.erase(it);
  return core::Result<bool, core::StorageError>::ok(true);
}

core::Result<bool, core::StorageError> InMemoryContactStore::verify(const core::ContactId& id) {
  auto it = std::find_if(contacts_.begin(), contacts_.end(),
                         [&id](const domain::Contact& c) { return c.contact_id == id; });
  if (it == contacts_.end()) {
    return core::Result<bool, core::StorageError>::err(core::StorageError::kNotFound);
  }
  it->is_verified = true;
  return core::Result<bool, core::StorageError>::ok(true);
}

std::vector<domain::Contact> InMemoryContactStore::list_all() const {
  return contacts_;
}

}  // namespace simb::storage
