#pragma once

#include <nlohmann/json.hpp>

#include "simb/bridge/handler_result.h"
#include "simb/bridge/server_context.h"

namespace simb::bridge::handlers {

HandlerResult handle_get_network_status(const nlohmann::json& params, ServerContext& ctx);

// Relay and mailbox preferences are accepted and acknowledged but not applied.
HandlerResult handle_configure_relay(const nlohmann::json& params, ServerContext& ctx);
HandlerResult handle_configure_mailbox(const nlohmann::json& params, ServerContext& ctx);

}  // namespace simb::bridge::handlers
