#pragma once

#include <nlohmann/json.hpp>

#include "simb/bridge/handler_result.h"
#include "simb/bridge/server_context.h"

namespace simb::bridge::handlers {

// Sets the shutdown flag. The response is still written before the loop exits.
HandlerResult handle_shutdown(const nlohmann::json& params, ServerContext& ctx);

}  // namespace simb::bridge::handlers
