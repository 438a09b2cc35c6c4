#pragma once

#include "simb/core/id_generator.h"
#include "simb/storage/contact_store.h"
#include "simb/storage/sqlite/sqlite_db.h"

#include <memory>

namespace simb::storage::sqlite {

// SqliteContactStore implements IContactStore on the contacts table.
// Insertion order is the AUTOINCREMENT seq column, so list_all() order survives restarts.
class SqliteContactStore final : public IContactStore {
 public:
  SqliteContactStore(std::shared_ptr<SqliteDb> db, core::IIdGenerator& id_gen);

  [[nodiscard]] core::Result<domain::Contact, core::StorageError> add(
      const NewContact& contact) override;
  [[nodiscard]] core::Result<bool, core::StorageError> remove(const core::ContactId& id) override;
  [[nodiscard]] core::Result<bool, core::StorageError> verify(const core::ContactId& id) override;
  [[nodiscard]] std::vector<domain::Contact> list_all() const override;

 private:
  std::shared_ptr<SqliteDb> db_;
  core::IIdGenerator& id_gen_;

  [[nodiscard]] domain::Contact row_to_contact(sqlite3_stmt* stmt) const;
};

}  // namespace simb::storage::sqlite
