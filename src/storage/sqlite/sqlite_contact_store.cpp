#include "simb/storage/sqlite/sqlite_contact_store.h"

#include <sqlite3.h>

#include <iostream>

namespace simb::storage::sqlite {

namespace {

constexpr const char* kSelectColumns =
    "SELECT contact_id, label, public_key, fingerprint, onion_address, mailbox_id, "
    "is_verified, has_session FROM contacts";

std::string column_text(sqlite3_stmt* stmt, int col) {
  const unsigned char* text = sqlite3_column_text(stmt, col);
  return text != nullptr ? reinterpret_cast<const char*>(text) : "";
}

}  // namespace

SqliteContactStore::SqliteContactStore(std::shared_ptr<SqliteDb> db, core::IIdGenerator& id_gen)
    : db_(std::move(db)), id_gen_(id_gen) {}

core::Result<domain::Contact, core::StorageError> SqliteContactStore::add(
    const NewContact& contact) {
  using AddResult = core::Result<domain::Contact, core::StorageError>;

  const char* sql = R"(
    INSERT INTO contacts (contact_id, label, public_key, fingerprint, onion_address, mailbox_id,
                          is_verified, has_session)
    VALUES (?, ?, ?, ?, ?, ?, 0, 0)
  )";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    std::cerr << "contacts: prepare failed: " << stmt.error() << "\n";
    return AddResult::err(core::StorageError::kUnavailable);
  }

  domain::Contact stored{
      .contact_id = core::ContactId{id_gen_.next("contact")},
      .label = contact.label,
      .public_key = contact.public_key,
      .fingerprint = contact.fingerprint,
      .onion_address = contact.onion_address,
      .mailbox_id = contact.mailbox_id,
  };

  sqlite3_bind_text(stmt.get(), 1, stored.contact_id.value.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 2, stored.label.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 3, stored.public_key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 4, stored.fingerprint.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 5, stored.onion_address.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 6, stored.mailbox_id.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_CONSTRAINT) {
    return AddResult::err(core::StorageError::kConflict);
  }
  if (rc != SQLITE_DONE) {
    std::cerr << "contacts: insert failed: " << db_->last_error() << "\n";
    return AddResult::err(core::StorageError::kUnavailable);
  }

  return AddResult::ok(std::move(stored));
}

core::Result<bool, core::StorageError> SqliteContactStore::remove(const core::ContactId& id) {
  PreparedStatement stmt(db_->connection(), "DELETE FROM contacts WHERE contact_id = ?");
  if (!stmt.is_valid()) {
    return core::Result<bool, core::StorageError>::err(core::StorageError::kUnavailable);
  }

  sqlite3_bind_text(stmt.get(), 1, id.value.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return core::Result<bool, core::StorageError>::err(core::StorageError::kUnavailable);
  }
  if (sqlite3_changes(db_->connection()) == 0) {
    return core::Result<bool, core::StorageError>::err(core::StorageError::kNotFound);
  }

  return core::Result<bool, core::StorageError>::ok(true);
}

core::Result<bool, core::StorageError> SqliteContactStore::verify(const core::ContactId& id) {
  PreparedStatement stmt(db_->connection(),
                         "UPDATE contacts SET is_verified = 1 WHERE contact_id = ?");
  if (!stmt.is_valid()) {
    return core::Result<bool, core::StorageError>::err(core::StorageError::kUnavailable);
  }

  sqlite3_bind_text(stmt.get(), 1, id.value.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return core::Result<bool, core::StorageError>::err(core::StorageError::kUnavailable);
  }
  if (sqlite3_changes(db_->connection()) == 0) {
    return core::Result<bool, core::StorageError>::err(core::StorageError::kNotFound);
  }

  return core::Result<bool, core::StorageError>::ok(true);
}

std::vector<domain::Contact> SqliteContactStore::list_all() const {
  PreparedStatement stmt(db_->connection(), std::string(kSelectColumns) + " ORDER BY seq");
  if (!stmt.is_valid()) {
    return {};
  }

  std::vector<domain::Contact> result;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    result.push_back(row_to_contact(stmt.get()));
  }

  return result;
}

domain::Contact SqliteContactStore::row_to_contact(sqlite3_stmt* stmt) const {
  domain::Contact contact;

  contact.contact_id = core::ContactId{column_text(stmt, 0)};
  contact.label = column_text(stmt, 1);
  contact.public_key = column_text(stmt, 2);
  contact.fingerprint = column_text(stmt, 3);
  contact.onion_address = column_text(stmt, 4);
  contact.mailbox_id = column_text(stmt, 5);
  contact.is_verified = sqlite3_column_int(stmt, 6) != 0;
  contact.has_session = sqlite3_column_int(stmt, 7) != 0;

  return contact;
}

}  // namespace simb::storage::sqlite
