#include "simb/bridge/session_state.h"

#include <stdexcept>

namespace simb::bridge {

SessionState::SessionState(ContactStoreFactory contact_store_factory,
                           std::unique_ptr<network::INetworkLayer> network)
    : contact_store_factory_(std::move(contact_store_factory)), network_(std::move(network)) {}

const identity::Identity& SessionState::require_identity() const {
  if (identity_ == nullptr) {
    throw std::runtime_error("No identity loaded");
  }
  return *identity_;
}

void SessionState::replace_identity(identity::Identity identity) {
  identity_ = std::make_unique<identity::Identity>(std::move(identity));
}

storage::IContactStore& SessionState::contacts() {
  std::call_once(contacts_once_, [this] {
    if (!contact_store_factory_) {
      throw std::runtime_error("Contact store is not configured");
    }
    auto store = contact_store_factory_();
    if (store == nullptr) {
      throw std::runtime_error("Contact store could not be opened");
    }
    contacts_ = std::move(store);
  });
  return *contacts_;
}

}  // namespace simb::bridge
