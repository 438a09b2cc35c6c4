#include "simb/domain/network_status.h"

namespace simb::domain {

using json = nlohmann::json;

std::string_view to_string(TorStatus status) {
  switch (status) {
    case TorStatus::kDisconnected:
      return "disconnected";
    case TorStatus::kConnecting:
      return "connecting";
    case TorStatus::kConnected:
      return "connected";
    case TorStatus::kError:
      return "error";
  }
  return "disconnected";
}

json network_status_to_json(const NetworkStatus& status) {
  json relays = json::array();
  for (const auto& relay : status.relays) {
    relays.push_back({
        {"address", relay.address},
        {"port", relay.port},
        {"public_key_fingerprint", relay.public_key_fingerprint},
        {"is_reachable", relay.is_reachable},
    });
  }

  json mailbox = nullptr;
  if (status.mailbox.has_value()) {
    mailbox = {
        {"address", status.mailbox->address},
        {"port", status.mailbox->port},
        {"is_reachable", status.mailbox->is_reachable},
        {"pending_count", status.mailbox->pending_count},
    };
  }

  json result;
  result["tor_status"] = std::string(to_string(status.tor_status));
  if (status.tor_circuit_info.has_value()) {
    result["tor_circuit_info"] = status.tor_circuit_info.value();
  } else {
    result["tor_circuit_info"] = nullptr;
  }
  result["relays"] = std::move(relays);
  result["mailbox"] = std::move(mailbox);
  result["cover_traffic_active"] = status.cover_traffic_active;
  result["cover_packets_sent"] = status.cover_packets_sent;
  result["real_packets_sent"] = status.real_packets_sent;
  return result;
}

}  // namespace simb::domain
