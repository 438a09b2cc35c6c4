#pragma once

#include "config.h"

#include "simb/identity/keystore.h"

#include <string>

namespace simb::bridge_app {

using identity::kMaxKdfBlocks;
using identity::kMinKdfBlocks;

// validate_bridge_config checks startup preconditions for the bridge.
//
// Returns: "" on success, non-empty error message on failure.
// Caller is responsible for printing the error and exiting with code 1.
//
// Preconditions checked (first failure is returned):
// - every flag value parsed
// - frame_queue_capacity > 0
// - kMinKdfBlocks <= kdf_blocks <= kMaxKdfBlocks
// - data_dir exists as a directory or can be created
[[nodiscard]] std::string validate_bridge_config(const BridgeConfig& config);

}  // namespace simb::bridge_app
