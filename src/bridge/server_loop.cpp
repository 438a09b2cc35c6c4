#include "simb/bridge/server_loop.h"

#include "simb/bridge/protocol.h"

#include <exception>
#include <iostream>

namespace simb::bridge {

using json = nlohmann::json;

namespace {

// Consecutive failures of the frame source before the input is treated as gone.
constexpr int kMaxConsecutiveReadFailures = 16;

std::string describe_id(const json& id) {
  return id.is_null() ? "null" : id.dump();
}

}  // namespace

std::string_view to_string(LoopExit exit) {
  switch (exit) {
    case LoopExit::kEndOfInput:
      return "end of input";
    case LoopExit::kShutdown:
      return "shutdown requested";
    case LoopExit::kOutputClosed:
      return "output closed";
  }
  return "unknown";
}

json handle_frame(const std::string& frame, const DispatchTable& table, ServerContext& ctx) {
  auto decoded = decode_request(frame);
  if (!decoded.has_value()) {
    const DecodeFailure& failure = decoded.error();
    std::cerr << failure.message << "\n";
    return make_error_response(failure.id, failure.code, failure.message);
  }

  const JsonRpcRequest& request = decoded.value();
  std::cerr << "Received: " << request.method << "\n";

  const MethodHandler* handler = table.find(request.method);
  if (handler == nullptr) {
    return make_error_response(request.id, kMethodNotFound, "Method not found: " + request.method);
  }

  if (!request.params.is_object()) {
    std::cerr << request.method << " (id " << describe_id(request.id)
              << ") failed: params must be an object\n";
    return make_error_response(request.id, kServerError,
                               "Internal error: params must be an object");
  }

  try {
    HandlerResult result = (*handler)(request.params, ctx);
    if (result.has_value()) {
      return make_response(request.id, result.value());
    }
    const HandlerError& error = result.error();
    std::cerr << request.method << " (id " << describe_id(request.id)
              << ") failed: " << error.message << "\n";
    return make_error_response(request.id, error.code, "Internal error: " + error.message);
  } catch (const std::exception& e) {
    std::cerr << request.method << " (id " << describe_id(request.id)
              << ") raised: " << e.what() << "\n";
    return make_error_response(request.id, kServerError,
                               std::string("Internal error: ") + e.what());
  }
}

LoopExit run_server_loop(IFrameSource& source, ResponseWriter& writer, const DispatchTable& table,
                         ServerContext& ctx) {
  int read_failures = 0;

  while (!ctx.lifecycle.shutdown_requested) {
    std::optional<std::string> frame;
    try {
      frame = source.next();
      read_failures = 0;
    } catch (const std::exception& e) {
      std::cerr << "Failed to read frame: " << e.what() << "\n";
      if (++read_failures >= kMaxConsecutiveReadFailures) {
        std::cerr << "Giving up on input after " << read_failures << " consecutive failures\n";
        return LoopExit::kEndOfInput;
      }
      continue;
    }

    if (!frame.has_value()) {
      return LoopExit::kEndOfInput;
    }

    json response;
    try {
      response = handle_frame(*frame, table, ctx);
    } catch (const std::exception& e) {
      // Only reachable if building the response itself failed.
      std::cerr << "Failed to handle frame: " << e.what() << "\n";
      response =
          make_error_response(nullptr, kServerError, std::string("Internal error: ") + e.what());
    }

    if (!writer.write(response)) {
      std::cerr << "Output stream closed; stopping\n";
      return LoopExit::kOutputClosed;
    }
  }

  return LoopExit::kShutdown;
}

}  // namespace simb::bridge
