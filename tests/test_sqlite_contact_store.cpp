#include "simb/core/id_generator.h"
#include "simb/storage/sqlite/sqlite_contact_store.h"
#include "simb/storage/sqlite/sqlite_db.h"

#include <catch2/catch_test_macros.hpp>

#include "test_support.h"

using namespace simb;

namespace {

std::shared_ptr<storage::sqlite::SqliteDb> open_memory_db() {
  auto db_result = storage::sqlite::SqliteDb::open(":memory:");
  REQUIRE(db_result.has_value());
  auto db = db_result.value();
  REQUIRE(db->ensure_schema().has_value());
  return db;
}

storage::NewContact new_contact(const std::string& label) {
  return storage::NewContact{
      .label = label,
      .public_key = std::string(64, 'b'),
      .fingerprint = std::string(64, 'e'),
      .onion_address = label + ".onion",
      .mailbox_id = "mailbox-" + label,
  };
}

}  // namespace

TEST_CASE("SqliteDb ensure_schema is idempotent", "[sqlite][schema]") {
  auto db = open_memory_db();
  CHECK(db->get_schema_version() == 1);
  REQUIRE(db->ensure_schema().has_value());
  CHECK(db->get_schema_version() == 1);
}

TEST_CASE("SqliteContactStore roundtrip", "[sqlite][contacts]") {
  core::DeterministicIdGenerator id_gen;
  storage::sqlite::SqliteContactStore store(open_memory_db(), id_gen);

  auto added = store.add(new_contact("erin"));
  REQUIRE(added.has_value());

  const auto all = store.list_all();
  REQUIRE(all.size() == 1);
  const domain::Contact& got = all.front();
  CHECK(got.contact_id == added.value().contact_id);
  CHECK(got.label == "erin");
  CHECK(got.public_key == std::string(64, 'b'));
  CHECK(got.fingerprint == std::string(64, 'e'));
  CHECK(got.onion_address == "erin.onion");
  CHECK(got.mailbox_id == "mailbox-erin");
  CHECK_FALSE(got.is_verified);
  CHECK_FALSE(got.has_session);
}

TEST_CASE("SqliteContactStore lists in insertion order", "[sqlite][contacts]") {
  core::DeterministicIdGenerator id_gen;
  storage::sqlite::SqliteContactStore store(open_memory_db(), id_gen);

  REQUIRE(store.add(new_contact("zed")).has_value());
  REQUIRE(store.add(new_contact("amy")).has_value());
  REQUIRE(store.add(new_contact("amy")).has_value());

  const auto all = store.list_all();
  REQUIRE(all.size() == 3);
  CHECK(all[0].label == "zed");
  CHECK(all[1].label == "amy");
  CHECK(all[2].label == "amy");
  CHECK(all[1].contact_id != all[2].contact_id);
}

TEST_CASE("SqliteContactStore verify and remove", "[sqlite][contacts]") {
  core::DeterministicIdGenerator id_gen;
  storage::sqlite::SqliteContactStore store(open_memory_db(), id_gen);
  const auto id = store.add(new_contact("finn")).value().contact_id;

  REQUIRE(store.verify(id).has_value());
  REQUIRE(store.list_all().size() == 1);
  CHECK(store.list_all().front().is_verified);

  REQUIRE(store.remove(id).has_value());
  CHECK(store.list_all().empty());

  auto again = store.remove(id);
  REQUIRE_FALSE(again.has_value());
  CHECK(again.error() == core::StorageError::kNotFound);

  auto verify_missing = store.verify(id);
  REQUIRE_FALSE(verify_missing.has_value());
  CHECK(verify_missing.error() == core::StorageError::kNotFound);
}

TEST_CASE("SqliteContactStore persists across reopen", "[sqlite][contacts]") {
  testing::ScopedTempDir dir("contacts");
  const std::string path = (dir.path() / "contacts.db").string();
  core::DeterministicIdGenerator id_gen;

  {
    auto db = storage::sqlite::SqliteDb::open(path);
    REQUIRE(db.has_value());
    REQUIRE(db.value()->ensure_schema().has_value());
    storage::sqlite::SqliteContactStore store(db.value(), id_gen);
    REQUIRE(store.add(new_contact("gail")).has_value());
  }

  auto db = storage::sqlite::SqliteDb::open(path);
  REQUIRE(db.has_value());
  REQUIRE(db.value()->ensure_schema().has_value());
  storage::sqlite::SqliteContactStore store(db.value(), id_gen);
  const auto all = store.list_all();
  REQUIRE(all.size() == 1);
  CHECK(all[0].label == "gail");
}
