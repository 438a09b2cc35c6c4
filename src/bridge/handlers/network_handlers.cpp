#include "simb/bridge/handlers/network_handlers.h"

#include "simb/domain/network_status.h"

#include <iostream>

namespace simb::bridge::handlers {

using json = nlohmann::json;

HandlerResult handle_get_network_status(const json& /*params*/, ServerContext& ctx) {
  const network::INetworkLayer* layer = ctx.session.network();
  const domain::NetworkStatus status = layer != nullptr ? layer->status() : domain::NetworkStatus{};
  return HandlerResult::ok(domain::network_status_to_json(status));
}

HandlerResult handle_configure_relay(const json& params, ServerContext& /*ctx*/) {
  std::cerr << "configure_relay: preferences acknowledged but not applied ("
            << params.size() << " keys)\n";
  return HandlerResult::ok(json{{"success", true}});
}

HandlerResult handle_configure_mailbox(const json& params, ServerContext& /*ctx*/) {
  std::cerr << "configure_mailbox: preferences acknowledged but not applied ("
            << params.size() << " keys)\n";
  return HandlerResult::ok(json{{"success", true}});
}

}  // namespace simb::bridge::handlers
