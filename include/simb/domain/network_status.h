#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace simb::domain {

enum class TorStatus {
  kDisconnected,
  kConnecting,
  kConnected,
  kError,
};

struct RelayInfo {
  std::string address;
  int port{0};
  std::string public_key_fingerprint;
  bool is_reachable{false};
};

struct MailboxStatus {
  std::string address;
  int port{0};
  bool is_reachable{false};
  int pending_count{0};
};

// NetworkStatus is a read-only snapshot reported by the network layer.
// The default value is the status of a process with no network layer attached.
struct NetworkStatus {
  TorStatus tor_status{TorStatus::kDisconnected};
  std::optional<std::string> tor_circuit_info;
  std::vector<RelayInfo> relays;
  std::optional<MailboxStatus> mailbox;
  bool cover_traffic_active{false};
  std::uint64_t cover_packets_sent{0};
  std::uint64_t real_packets_sent{0};
};

[[nodiscard]] std::string_view to_string(TorStatus status);

// Absent optionals serialize as null.
[[nodiscard]] nlohmann::json network_status_to_json(const NetworkStatus& status);

}  // namespace simb::domain
