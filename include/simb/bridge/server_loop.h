#pragma once

#include "simb/bridge/dispatch_table.h"
#include "simb/bridge/frame_reader.h"
#include "simb/bridge/response_writer.h"
#include "simb/bridge/server_context.h"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace simb::bridge {

enum class LoopExit {
  kEndOfInput,    // parent closed stdin
  kShutdown,      // a shutdown request completed
  kOutputClosed,  // the protocol stream stopped accepting writes
};

[[nodiscard]] std::string_view to_string(LoopExit exit);

// handle_frame turns one frame into exactly one response message.
// Never throws for handler failures; they become error responses for the request id.
[[nodiscard]] nlohmann::json handle_frame(const std::string& frame, const DispatchTable& table,
                                          ServerContext& ctx);

// run_server_loop reads, dispatches and answers frames strictly one at a time,
// so responses leave in the order requests arrived. Diagnostics go to stderr.
LoopExit run_server_loop(IFrameSource& source, ResponseWriter& writer, const DispatchTable& table,
                         ServerContext& ctx);

}  // namespace simb::bridge
