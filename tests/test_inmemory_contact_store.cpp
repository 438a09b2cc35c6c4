#include "simb/core/id_generator.h"
#include "simb/storage/inmemory_contact_store.h"

#include <catch2/catch_test_macros.hpp>

using namespace simb;

namespace {

storage::NewContact new_contact(const std::string& label) {
  return storage::NewContact{
      .label = label,
      .public_key = std::string(64, 'a'),
      .fingerprint = std::string(64, 'f'),
      .onion_address = "",
      .mailbox_id = "",
  };
}

}  // namespace

TEST_CASE("InMemoryContactStore add assigns ids and keeps insertion order",
          "[inmemory][contacts]") {
  core::DeterministicIdGenerator id_gen;
  storage::InMemoryContactStore store(id_gen);

  auto bob = store.add(new_contact("bob"));
  auto alice = store.add(new_contact("alice"));
  REQUIRE(bob.has_value());
  REQUIRE(alice.has_value());
  CHECK(bob.value().contact_id.value == "contact-0");
  CHECK(alice.value().contact_id.value == "contact-1");
  CHECK_FALSE(bob.value().is_verified);
  CHECK_FALSE(bob.value().has_session);

  const auto all = store.list_all();
  REQUIRE(all.size() == 2);
  CHECK(all[0].label == "bob");
  CHECK(all[1].label == "alice");
}

TEST_CASE("InMemoryContactStore keeps duplicates distinct", "[inmemory][contacts]") {
  core::DeterministicIdGenerator id_gen;
  storage::InMemoryContactStore store(id_gen);

  auto first = store.add(new_contact("carol"));
  auto second = store.add(new_contact("carol"));
  REQUIRE(first.has_value());
  REQUIRE(second.has_value());
  CHECK(first.value().contact_id != second.value().contact_id);
  CHECK(store.list_all().size() == 2);
}

TEST_CASE("InMemoryContactStore verify and remove", "[inmemory][contacts]") {
  core::DeterministicIdGenerator id_gen;
  storage::InMemoryContactStore store(id_gen);
  const auto id = store.add(new_contact("dave")).value().contact_id;

  SECTION("verify marks the contact") {
    REQUIRE(store.verify(id).has_value());
    const auto all = store.list_all();
    REQUIRE(all.size() == 1);
    CHECK(all.front().contact_id == id);
    CHECK(all.front().is_verified);
  }

  SECTION("remove deletes the contact") {
    REQUIRE(store.remove(id).has_value());
    CHECK(store.list_all().empty());
  }

  SECTION("unknown ids are reported") {
    const core::ContactId missing{"contact-99"};
    auto removed = store.remove(missing);
    auto verified = store.verify(missing);
    REQUIRE_FALSE(removed.has_value());
    REQUIRE_FALSE(verified.has_value());
    CHECK(removed.error() == core::StorageError::kNotFound);
    CHECK(verified.error() == core::StorageError::kNotFound);
    CHECK(store.list_all().size() == 1);
  }
}
