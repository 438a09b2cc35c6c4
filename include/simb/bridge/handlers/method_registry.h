#pragma once

#include "simb/bridge/dispatch_table.h"

namespace simb::bridge::handlers {

// build_method_registry returns the dispatch table for every method the bridge serves.
[[nodiscard]] DispatchTable build_method_registry();

}  // namespace simb::bridge::handlers
