#pragma once

#include "simb/domain/network_status.h"

namespace simb::network {

// INetworkLayer is the bridge's read-only view of the anonymity network and cover traffic.
// The bridge never drives the network; it only reports what the layer says.
class INetworkLayer {
 public:
  virtual ~INetworkLayer() = default;

  [[nodiscard]] virtual domain::NetworkStatus status() const = 0;

 protected:
  INetworkLayer() = default;
  INetworkLayer(const INetworkLayer&) = default;
  INetworkLayer& operator=(const INetworkLayer&) = default;
  INetworkLayer(INetworkLayer&&) = default;
  INetworkLayer& operator=(INetworkLayer&&) = default;
};

}  // namespace simb::network
