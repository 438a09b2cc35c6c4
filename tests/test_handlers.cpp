#include "simb/bridge/handlers/contact_handlers.h"
#include "simb/bridge/handlers/identity_handlers.h"
#include "simb/bridge/handlers/lifecycle_handlers.h"
#include "simb/bridge/handlers/messaging_handlers.h"
#include "simb/bridge/handlers/network_handlers.h"
#include "simb/bridge/protocol.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "test_support.h"

using namespace simb;
using namespace simb::bridge::handlers;
using Catch::Matchers::ContainsSubstring;
using json = nlohmann::json;

namespace {

const std::string kPeerKey(64, 'c');

json ok_value(const bridge::HandlerResult& result) {
  REQUIRE(result.has_value());
  return result.value();
}

std::string error_message(const bridge::HandlerResult& result) {
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().code == bridge::kServerError);
  return result.error().message;
}

}  // namespace

// ── Identity ────────────────────────────────────────────────────────────────

TEST_CASE("generate_identity requires a passphrase", "[handlers][identity]") {
  testing::BridgeHarness h;

  SECTION("missing") {
    CHECK(error_message(handle_generate_identity(json::object(), h.ctx)) ==
          "Passphrase is required");
  }
  SECTION("empty") {
    CHECK(error_message(handle_generate_identity({{"passphrase", ""}}, h.ctx)) ==
          "Passphrase is required");
  }
  SECTION("not a string") {
    CHECK(error_message(handle_generate_identity({{"passphrase", 5}}, h.ctx)) ==
          "Passphrase is required");
  }

  CHECK_FALSE(h.session.has_identity());
  CHECK(h.keystore.save_count == 0);
}

TEST_CASE("generate_identity saves and loads the identity", "[handlers][identity]") {
  testing::BridgeHarness h;

  const json result = ok_value(handle_generate_identity({{"passphrase", "pw"}}, h.ctx));
  CHECK(result["is_loaded"] == true);
  CHECK(result["public_key"].get<std::string>().size() == 64);
  CHECK(result["fingerprint"].get<std::string>().size() == 64);
  CHECK(h.keystore.save_count == 1);
  REQUIRE(h.session.has_identity());
  CHECK(h.session.require_identity().public_key_hex() == result["public_key"]);
}

TEST_CASE("load_identity reads the stored identity", "[handlers][identity]") {
  testing::BridgeHarness h;

  SECTION("nothing stored") {
    CHECK(error_message(handle_load_identity({{"passphrase", "pw"}}, h.ctx)) ==
          "No keystore found");
    CHECK_FALSE(h.session.has_identity());
  }

  SECTION("wrong passphrase keeps the current identity") {
    const json generated = ok_value(handle_generate_identity({{"passphrase", "pw"}}, h.ctx));
    CHECK(error_message(handle_load_identity({{"passphrase", "nope"}}, h.ctx)) ==
          "Invalid passphrase or corrupted keystore");
    CHECK(h.session.require_identity().fingerprint_hex() == generated["fingerprint"]);
  }

  SECTION("correct passphrase") {
    const json generated = ok_value(handle_generate_identity({{"passphrase", "pw"}}, h.ctx));
    const json loaded = ok_value(handle_load_identity({{"passphrase", "pw"}}, h.ctx));
    CHECK(loaded == generated);
  }

  SECTION("missing passphrase") {
    CHECK(error_message(handle_load_identity(json::object(), h.ctx)) == "Passphrase is required");
  }
}

TEST_CASE("export_identity needs a loaded identity", "[handlers][identity]") {
  testing::BridgeHarness h;
  CHECK(error_message(handle_export_identity(json::object(), h.ctx)) == "No identity loaded");

  const json generated = ok_value(handle_generate_identity({{"passphrase", "pw"}}, h.ctx));
  const json exported = ok_value(handle_export_identity(json::object(), h.ctx));
  REQUIRE(exported["export_data"].is_string());
  const json data = json::parse(exported["export_data"].get<std::string>());
  CHECK(data["public_key"] == generated["public_key"]);
  CHECK(data["fingerprint"] == generated["fingerprint"]);
}

TEST_CASE("import_identity loads a public-only identity", "[handlers][identity]") {
  testing::BridgeHarness h;
  const std::string import_data = json{{"public_key", kPeerKey}}.dump();

  SECTION("success") {
    const json result = ok_value(
        handle_import_identity({{"import_data", import_data}, {"passphrase", "pw"}}, h.ctx));
    CHECK(result["public_key"] == kPeerKey);
    CHECK(result["is_loaded"] == true);
    REQUIRE(h.session.has_identity());
    CHECK_FALSE(h.session.require_identity().has_secret_key());
    CHECK(h.keystore.save_count == 0);
  }

  SECTION("passphrase required") {
    CHECK(error_message(handle_import_identity({{"import_data", import_data}}, h.ctx)) ==
          "Import data and passphrase required");
    CHECK_FALSE(h.session.has_identity());
  }

  SECTION("import data required") {
    CHECK(error_message(handle_import_identity({{"passphrase", "pw"}}, h.ctx)) ==
          "Import data and passphrase required");
  }

  SECTION("malformed import data") {
    CHECK_THAT(error_message(handle_import_identity(
                   {{"import_data", "not json"}, {"passphrase", "pw"}}, h.ctx)),
               ContainsSubstring("not valid JSON"));
    CHECK_THAT(error_message(handle_import_identity(
                   {{"import_data", R"({"key":"x"})"}, {"passphrase", "pw"}}, h.ctx)),
               ContainsSubstring("public_key"));
    CHECK_THAT(error_message(handle_import_identity(
                   {{"import_data", R"({"public_key":"xyz"})"}, {"passphrase", "pw"}}, h.ctx)),
               ContainsSubstring("hex"));
    CHECK_FALSE(h.session.has_identity());
  }
}

// ── Contacts ────────────────────────────────────────────────────────────────

TEST_CASE("add_contact validates before touching the store", "[handlers][contacts]") {
  testing::BridgeHarness h;

  CHECK_THAT(error_message(handle_add_contact({{"public_key", kPeerKey}}, h.ctx)),
             ContainsSubstring("label"));
  CHECK_THAT(error_message(handle_add_contact({{"label", "x"}}, h.ctx)),
             ContainsSubstring("public_key"));
  CHECK_THAT(error_message(handle_add_contact(
                 {{"label", "x"}, {"public_key", kPeerKey}, {"onion_address", 3}}, h.ctx)),
             ContainsSubstring("onion_address"));
  CHECK(h.contact_store_opens == 0);
}

TEST_CASE("add_contact returns the stored contact", "[handlers][contacts]") {
  testing::BridgeHarness h;
  const json contact = ok_value(handle_add_contact(
      {{"label", "alice"}, {"public_key", kPeerKey}, {"onion_address", "a.onion"}}, h.ctx));

  CHECK(contact["id"] == "contact-0");
  CHECK(contact["label"] == "alice");
  CHECK(contact["public_key"] == kPeerKey);
  CHECK(contact["fingerprint"] ==
        h.identity_provider.from_public_key_hex(kPeerKey).fingerprint_hex());
  CHECK(contact["onion_address"] == "a.onion");
  CHECK(contact["mailbox_id"] == "");
  CHECK(contact["is_verified"] == false);
  CHECK(h.contact_store_opens == 1);
}

TEST_CASE("remove and verify work on a fresh session", "[handlers][contacts]") {
  testing::BridgeHarness h;

  CHECK(error_message(handle_remove_contact({{"contact_id", "contact-7"}}, h.ctx)) ==
        "Contact not found: contact-7");
  CHECK(error_message(handle_verify_contact({{"contact_id", "contact-7"}}, h.ctx)) ==
        "Contact not found: contact-7");
  CHECK(h.contact_store_opens == 1);

  const json added =
      ok_value(handle_add_contact({{"label", "bob"}, {"public_key", kPeerKey}}, h.ctx));
  const std::string id = added["id"].get<std::string>();

  CHECK(ok_value(handle_verify_contact({{"contact_id", id}}, h.ctx)) == json{{"success", true}});
  const json listed = ok_value(handle_list_contacts(json::object(), h.ctx));
  REQUIRE(listed["contacts"].size() == 1);
  CHECK(listed["contacts"][0]["is_verified"] == true);

  CHECK(ok_value(handle_remove_contact({{"contact_id", id}}, h.ctx)) == json{{"success", true}});
  CHECK(ok_value(handle_list_contacts(json::object(), h.ctx))["contacts"].empty());
}

// ── Messaging ───────────────────────────────────────────────────────────────

TEST_CASE("send_message requires parameters and an identity", "[handlers][messaging]") {
  testing::BridgeHarness h;

  CHECK_THAT(error_message(handle_send_message({{"text", "hi"}}, h.ctx)),
             ContainsSubstring("contact_id"));
  CHECK_THAT(error_message(handle_send_message({{"contact_id", "c"}}, h.ctx)),
             ContainsSubstring("text"));
  CHECK(error_message(handle_send_message({{"contact_id", "c"}, {"text", "hi"}}, h.ctx)) ==
        "No identity loaded");
  CHECK(error_message(handle_send_voice_message({{"contact_id", "c"}}, h.ctx)) ==
        "No identity loaded");
}

TEST_CASE("send_message returns the outgoing message", "[handlers][messaging]") {
  testing::BridgeHarness h;
  REQUIRE(handle_generate_identity({{"passphrase", "pw"}}, h.ctx).has_value());

  const json text = ok_value(handle_send_message({{"contact_id", "c1"}, {"text", "hi"}}, h.ctx));
  CHECK(text["id"] == "0");
  CHECK(text["contact_id"] == "c1");
  CHECK(text["is_outgoing"] == true);
  CHECK(text["type"] == "text");
  CHECK(text["text_content"] == "hi");
  CHECK(text["delivery_status"] == "sent");
  CHECK(text["sequence_index"] == 0);

  const json empty = ok_value(handle_send_message({{"contact_id", "c1"}, {"text", ""}}, h.ctx));
  CHECK(empty["text_content"] == "");

  const json voice = ok_value(
      handle_send_voice_message({{"contact_id", "c1"}, {"file_path", "/v.opus"}}, h.ctx));
  CHECK(voice["type"] == "voice");
  CHECK(voice["voice_data_path"] == "/v.opus");
  CHECK_FALSE(voice.contains("text_content"));
  CHECK(voice["id"] != text["id"]);
}

TEST_CASE("Mailbox stubs return no messages", "[handlers][messaging]") {
  testing::BridgeHarness h;
  CHECK(ok_value(handle_poll_mailbox(json::object(), h.ctx)) ==
        json{{"messages", json::array()}});
  CHECK(ok_value(handle_get_messages({{"contact_id", "c1"}}, h.ctx)) ==
        json{{"messages", json::array()}});
}

// ── Network and lifecycle ───────────────────────────────────────────────────

TEST_CASE("get_network_status without a network layer", "[handlers][network]") {
  testing::BridgeHarness h;
  const json status = ok_value(handle_get_network_status(json::object(), h.ctx));
  CHECK(status["tor_status"] == "disconnected");
  CHECK(status["cover_packets_sent"] == 0);
  CHECK(status["mailbox"].is_null());
}

TEST_CASE("get_network_status reports the attached layer", "[handlers][network]") {
  domain::NetworkStatus fixed;
  fixed.tor_status = domain::TorStatus::kConnected;
  fixed.cover_traffic_active = true;
  fixed.real_packets_sent = 4;
  testing::BridgeHarness h(std::make_unique<testing::FixedNetworkLayer>(fixed));

  const json status = ok_value(handle_get_network_status(json::object(), h.ctx));
  CHECK(status["tor_status"] == "connected");
  CHECK(status["cover_traffic_active"] == true);
  CHECK(status["real_packets_sent"] == 4);
}

TEST_CASE("Configuration stubs acknowledge", "[handlers][network]") {
  testing::BridgeHarness h;
  CHECK(ok_value(handle_configure_relay({{"relays", json::array()}}, h.ctx)) ==
        json{{"success", true}});
  CHECK(ok_value(handle_configure_mailbox(json::object(), h.ctx)) == json{{"success", true}});
}

TEST_CASE("shutdown sets the flag", "[handlers][lifecycle]") {
  testing::BridgeHarness h;
  CHECK(ok_value(handle_shutdown(json::object(), h.ctx)) == json{{"success", true}});
  CHECK(h.lifecycle.shutdown_requested);
}
