#include "simb/bridge/handlers/messaging_handlers.h"

#include "simb/bridge/handlers/handler_support.h"
#include "simb/domain/message.h"

#include <iostream>

namespace simb::bridge::handlers {

using json = nlohmann::json;

namespace {

// Builds the record of an outgoing message handed to the transport.
// Every message is reported as sent with the initial sequence index.
domain::Message outgoing_message(ServerContext& ctx, const std::string& contact_id,
                                 domain::MessageType type) {
  return domain::Message{
      .message_id = core::MessageId{ctx.services.id_gen.next("")},
      .contact_id = core::ContactId{contact_id},
      .is_outgoing = true,
      .type = type,
      .text_content = std::nullopt,
      .voice_data_path = std::nullopt,
      .delivery_status = domain::DeliveryStatus::kSent,
      .sequence_index = 0,
  };
}

json empty_message_list() {
  return json{{"messages", json::array()}};
}

}  // namespace

HandlerResult handle_send_message(const json& params, ServerContext& ctx) {
  return guarded([&]() -> json {
    const std::string contact_id =
        require_string(params, "contact_id", "contact_id is required");
    // Empty text is a valid message body.
    const std::string text = require_string_allow_empty(params, "text", "text is required");
    (void)ctx.session.require_identity();

    domain::Message message = outgoing_message(ctx, contact_id, domain::MessageType::kText);
    message.text_content = text;
    return domain::message_to_json(message);
  });
}

HandlerResult handle_send_voice_message(const json& params, ServerContext& ctx) {
  return guarded([&]() -> json {
    const std::string contact_id =
        require_string(params, "contact_id", "contact_id is required");
    const std::string file_path = optional_string(params, "file_path");
    (void)ctx.session.require_identity();

    domain::Message message = outgoing_message(ctx, contact_id, domain::MessageType::kVoice);
    message.voice_data_path = file_path;
    return domain::message_to_json(message);
  });
}

HandlerResult handle_poll_mailbox(const json& /*params*/, ServerContext& /*ctx*/) {
  std::cerr << "poll_mailbox: no mailbox transport attached; returning no messages\n";
  return HandlerResult::ok(empty_message_list());
}

HandlerResult handle_get_messages(const json& params, ServerContext& /*ctx*/) {
  return guarded([&]() -> json {
    const std::string contact_id = optional_string(params, "contact_id");
    std::cerr << "get_messages: no message history kept"
              << (contact_id.empty() ? std::string() : " for " + contact_id) << "\n";
    return empty_message_list();
  });
}

}  // namespace simb::bridge::handlers
