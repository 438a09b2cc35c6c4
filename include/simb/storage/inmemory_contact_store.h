#pragma once

#include "simb/core/id_generator.h"
#include "simb/storage/contact_store.h"

#include <vector>

namespace simb::storage {

// InMemoryContactStore keeps contacts in a vector, which preserves insertion order.
// Used with --contacts-backend inmemory and in tests. Contents are lost on exit.
class InMemoryContactStore final : public IContactStore {
 public:
  explicit InMemoryContactStore(core::IIdGenerator& id_gen) : id_gen_(id_gen) {}

  [[nodiscard]] core::Result<domain::Contact, core::StorageError> add(
      const NewContact& contact) override;
  [[nodiscard]] core::Result<bool, core::StorageError> remove(const core::ContactId& id) override;
  [[nodiscard]] core::Result<bool, core::StorageError> verify(const core::ContactId& id) override;
  [[nodiscard]] std::vector<domain::Contact> list_all() const override;

 private:
  core::IIdGenerator& id_gen_;
  std::vector<domain::Contact> contacts_;
};

}  // namespace simb::storage
