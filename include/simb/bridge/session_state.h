#pragma once

#include "simb/identity/identity.h"
#include "simb/network/network_layer.h"
#include "simb/storage/contact_store.h"

#include <functional>
#include <memory>
#include <mutex>

namespace simb::bridge {

// SessionState is the process-lifetime, in-memory state the handlers share:
// - at most one loaded identity, replaced wholesale by generate/load/import
// - the contact store, created by the factory on first use and reused afterwards
// - an optional network layer handle
//
// Only handler bodies touch it, and only one handler runs at a time.
// Lazy construction goes through std::call_once so a concurrent dispatcher
// cannot build two stores.
class SessionState {
 public:
  using ContactStoreFactory = std::function<std::unique_ptr<storage::IContactStore>()>;

  explicit SessionState(ContactStoreFactory contact_store_factory,
                        std::unique_ptr<network::INetworkLayer> network = nullptr);

  SessionState(const SessionState&) = delete;
  SessionState& operator=(const SessionState&) = delete;
  SessionState(SessionState&&) = delete;
  SessionState& operator=(SessionState&&) = delete;
  ~SessionState() = default;

  [[nodiscard]] bool has_identity() const { return identity_ != nullptr; }

  // nullptr when no identity is loaded.
  [[nodiscard]] const identity::Identity* identity() const { return identity_.get(); }

  // Throws std::runtime_error("No identity loaded") in the unloaded state.
  [[nodiscard]] const identity::Identity& require_identity() const;

  // Discards any previously loaded identity.
  void replace_identity(identity::Identity identity);

  // Creates the store on first call. If the factory throws, the next call retries.
  [[nodiscard]] storage::IContactStore& contacts();
  [[nodiscard]] bool contacts_initialized() const { return contacts_ != nullptr; }

  // nullptr when no network layer is attached.
  [[nodiscard]] const network::INetworkLayer* network() const { return network_.get(); }

 private:
  std::unique_ptr<identity::Identity> identity_;

  ContactStoreFactory contact_store_factory_;
  std::once_flag contacts_once_;
  std::unique_ptr<storage::IContactStore> contacts_;

  std::unique_ptr<network::INetworkLayer> network_;
};

}  // namespace simb::bridge
