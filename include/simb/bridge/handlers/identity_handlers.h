#pragma once

#include <nlohmann/json.hpp>

#include "simb/bridge/handler_result.h"
#include "simb/bridge/server_context.h"

namespace simb::bridge::handlers {

HandlerResult handle_generate_identity(const nlohmann::json& params, ServerContext& ctx);
HandlerResult handle_load_identity(const nlohmann::json& params, ServerContext& ctx);
HandlerResult handle_export_identity(const nlohmann::json& params, ServerContext& ctx);
HandlerResult handle_import_identity(const nlohmann::json& params, ServerContext& ctx);

}  // namespace simb::bridge::handlers
