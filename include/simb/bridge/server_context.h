#pragma once

#include "simb/bridge/session_state.h"
#include "simb/core/id_generator.h"
#include "simb/identity/identity_provider.h"
#include "simb/identity/keystore.h"

namespace simb::bridge {

// Services bundles the stateless collaborators. It holds references, not ownership;
// main() (or a test) owns the concrete instances.
struct Services {
  identity::IIdentityProvider& identity_provider;  // NOLINT(readability-identifier-naming)
  identity::IKeyStore& keystore;                   // NOLINT(readability-identifier-naming)
  core::IIdGenerator& id_gen;                      // NOLINT(readability-identifier-naming)
};

// Lifecycle carries the shutdown flag. The run loop checks it between requests only.
struct Lifecycle {
  bool shutdown_requested{false};  // NOLINT(readability-identifier-naming)
};

// ServerContext is passed to every handler.
// All references must remain valid for the lifetime of run_server_loop().
struct ServerContext {
  Services& services;     // NOLINT(readability-identifier-naming)
  SessionState& session;  // NOLINT(readability-identifier-naming)
  Lifecycle& lifecycle;   // NOLINT(readability-identifier-naming)
};

}  // namespace simb::bridge
