#include "simb/bridge/session_state.h"
#include "simb/identity/identity_provider.h"

#include <catch2/catch_test_macros.hpp>

#include "test_support.h"

#include <stdexcept>

using namespace simb;

TEST_CASE("SessionState starts unloaded", "[session]") {
  bridge::SessionState session(nullptr);
  CHECK_FALSE(session.has_identity());
  CHECK(session.identity() == nullptr);
  CHECK_THROWS_WITH(session.require_identity(), "No identity loaded");
  CHECK(session.network() == nullptr);
}

TEST_CASE("SessionState replace_identity swaps the loaded identity", "[session]") {
  bridge::SessionState session(nullptr);
  identity::Ed25519IdentityProvider provider;

  auto first = provider.generate();
  const std::string first_fp = first.fingerprint_hex();
  session.replace_identity(std::move(first));
  REQUIRE(session.has_identity());
  CHECK(session.require_identity().fingerprint_hex() == first_fp);

  auto second = provider.generate();
  const std::string second_fp = second.fingerprint_hex();
  session.replace_identity(std::move(second));
  CHECK(session.require_identity().fingerprint_hex() == second_fp);
}

TEST_CASE("SessionState builds the contact store once", "[session]") {
  testing::BridgeHarness harness;
  CHECK_FALSE(harness.session.contacts_initialized());
  CHECK(harness.contact_store_opens == 0);

  storage::IContactStore& first = harness.session.contacts();
  storage::IContactStore& second = harness.session.contacts();
  CHECK(&first == &second);
  CHECK(harness.contact_store_opens == 1);
  CHECK(harness.session.contacts_initialized());
}

TEST_CASE("SessionState retries a failed contact store factory", "[session]") {
  int attempts = 0;
  core::DeterministicIdGenerator id_gen;
  bridge::SessionState session([&]() -> std::unique_ptr<storage::IContactStore> {
    if (++attempts == 1) {
      throw std::runtime_error("database locked");
    }
    return std::make_unique<storage::InMemoryContactStore>(id_gen);
  });

  CHECK_THROWS_WITH(session.contacts(), "database locked");
  CHECK_FALSE(session.contacts_initialized());
  CHECK_NOTHROW(session.contacts());
  CHECK(attempts == 2);
}

TEST_CASE("SessionState reports a missing contact store", "[session]") {
  bridge::SessionState unconfigured(nullptr);
  CHECK_THROWS_AS(unconfigured.contacts(), std::runtime_error);

  bridge::SessionState null_factory([]() -> std::unique_ptr<storage::IContactStore> {
    return nullptr;
  });
  CHECK_THROWS_AS(null_factory.contacts(), std::runtime_error);
}
