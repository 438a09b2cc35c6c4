#include "simb/bridge/handlers/lifecycle_handlers.h"

#include <iostream>

namespace simb::bridge::handlers {

using json = nlohmann::json;

HandlerResult handle_shutdown(const json& /*params*/, ServerContext& ctx) {
  std::cerr << "Shutdown requested\n";
  ctx.lifecycle.shutdown_requested = true;
  return HandlerResult::ok(json{{"success", true}});
}

}  // namespace simb::bridge::handlers
