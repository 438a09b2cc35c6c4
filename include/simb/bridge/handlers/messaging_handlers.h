#pragma once

#include <nlohmann/json.hpp>

#include "simb/bridge/handler_result.h"
#include "simb/bridge/server_context.h"

namespace simb::bridge::handlers {

HandlerResult handle_send_message(const nlohmann::json& params, ServerContext& ctx);
HandlerResult handle_send_voice_message(const nlohmann::json& params, ServerContext& ctx);

// Mailbox retrieval is not wired to a transport yet. Both return an empty message list.
HandlerResult handle_poll_mailbox(const nlohmann::json& params, ServerContext& ctx);
HandlerResult handle_get_messages(const nlohmann::json& params, ServerContext& ctx);

}  // namespace simb::bridge::handlers
