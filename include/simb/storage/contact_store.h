#pragma once

#include "simb/core/result.h"
#include "simb/domain/contact.h"

#include <string>
#include <vector>

namespace simb::storage {

// NewContact is the caller-supplied part of a contact; the store assigns the id.
struct NewContact {
  std::string label;
  std::string public_key;
  std::string fingerprint;
  std::string onion_address;
  std::string mailbox_id;
};

// IContactStore isolates contact persistence from the bridge.
// Contract: list_all() returns contacts in insertion order. Adding the same
// label/public_key twice creates two distinct contacts.
class IContactStore {
 public:
  virtual ~IContactStore() = default;

  [[nodiscard]] virtual core::Result<domain::Contact, core::StorageError> add(
      const NewContact& contact) = 0;
  [[nodiscard]] virtual core::Result<bool, core::StorageError> remove(
      const core::ContactId& id) = 0;
  [[nodiscard]] virtual core::Result<bool, core::StorageError> verify(
      const core::ContactId& id) = 0;
  [[nodiscard]] virtual std::vector<domain::Contact> list_all() const = 0;

 protected:
  IContactStore() = default;
  IContactStore(const IContactStore&) = default;
  IContactStore& operator=(const IContactStore&) = default;
  IContactStore(IContactStore&&) = default;
  IContactStore& operator=(IContactStore&&) = default;
};

}  // namespace simb::storage
