#pragma once

#include <nlohmann/json.hpp>

#include "simb/bridge/handler_result.h"
#include "simb/bridge/server_context.h"

namespace simb::bridge::handlers {

HandlerResult handle_add_contact(const nlohmann::json& params, ServerContext& ctx);
HandlerResult handle_remove_contact(const nlohmann::json& params, ServerContext& ctx);
HandlerResult handle_list_contacts(const nlohmann::json& params, ServerContext& ctx);
HandlerResult handle_verify_contact(const nlohmann::json& params, ServerContext& ctx);

}  // namespace simb::bridge::handlers
