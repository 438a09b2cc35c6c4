#include "simb/bridge/handlers/contact_handlers.h"

#include "simb/bridge/handlers/handler_support.h"
#include "simb/domain/contact.h"
#include "simb/storage/contact_store.h"

#include <stdexcept>

namespace simb::bridge::handlers {

using json = nlohmann::json;

namespace {

std::string storage_error_message(core::StorageError error) {
  switch (error) {
    case core::StorageError::kNotFound:
      return "Contact not found";
    case core::StorageError::kConflict:
      return "Contact already exists";
    case core::StorageError::kUnavailable:
      return "Contact storage unavailable";
  }
  return "Contact storage error";
}

// Maps a remove/verify outcome to a result, naming the id when it is unknown.
json acknowledge(const core::Result<bool, core::StorageError>& outcome,
                 const core::ContactId& id) {
  if (!outcome.has_value()) {
    if (outcome.error() == core::StorageError::kNotFound) {
      throw std::runtime_error("Contact not found: " + id.value);
    }
    throw std::runtime_error(storage_error_message(outcome.error()));
  }
  return json{{"success", true}};
}

}  // namespace

HandlerResult handle_add_contact(const json& params, ServerContext& ctx) {
  return guarded([&]() -> json {
    const std::string label = require_string(params, "label", "Contact label is required");
    const std::string public_key_hex =
        require_string(params, "public_key", "Contact public_key is required");
    const std::string onion_address = optional_string(params, "onion_address");
    const std::string mailbox_id = optional_string(params, "mailbox_id");

    // Parsing normalizes the key and derives the fingerprint the user verifies.
    const identity::Identity peer =
        ctx.services.identity_provider.from_public_key_hex(public_key_hex);

    auto added = ctx.session.contacts().add(storage::NewContact{
        .label = label,
        .public_key = peer.public_key_hex(),
        .fingerprint = peer.fingerprint_hex(),
        .onion_address = onion_address,
        .mailbox_id = mailbox_id,
    });
    if (!added.has_value()) {
      throw std::runtime_error(storage_error_message(added.error()));
    }
    return domain::contact_to_json(added.value());
  });
}

HandlerResult handle_remove_contact(const json& params, ServerContext& ctx) {
  return guarded([&]() -> json {
    const core::ContactId id{require_string(params, "contact_id", "contact_id is required")};
    return acknowledge(ctx.session.contacts().remove(id), id);
  });
}

HandlerResult handle_list_contacts(const json& /*params*/, ServerContext& ctx) {
  return guarded([&]() -> json {
    json contacts = json::array();
    for (const auto& contact : ctx.session.contacts().list_all()) {
      contacts.push_back(domain::contact_to_json(contact));
    }
    return json{{"contacts", std::move(contacts)}};
  });
}

HandlerResult handle_verify_contact(const json& params, ServerContext& ctx) {
  return guarded([&]() -> json {
    const core::ContactId id{require_string(params, "contact_id", "contact_id is required")};
    return acknowledge(ctx.session.contacts().verify(id), id);
  });
}

}  // namespace simb::bridge::handlers
