#pragma once

#include "simb/core/result.h"

#include <nlohmann/json.hpp>

#include <string>

namespace simb::bridge {

// JSON-RPC 2.0 request as seen by handlers.
// id is echoed verbatim; an absent id is stored as null.
struct JsonRpcRequest {
  nlohmann::json id;      // NOLINT(readability-identifier-naming)
  std::string method;     // NOLINT(readability-identifier-naming)
  nlohmann::json params;  // NOLINT(readability-identifier-naming)
};

// DecodeFailure is a frame that cannot become a request. It is still answered.
struct DecodeFailure {
  nlohmann::json id;    // NOLINT(readability-identifier-naming)
  int code;             // NOLINT(readability-identifier-naming)
  std::string message;  // NOLINT(readability-identifier-naming)
};

// Error codes (JSON-RPC 2.0 reserved range)
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
// Handler failures: preconditions, missing parameters, collaborator errors.
constexpr int kServerError = -32000;

constexpr const char* kJsonRpcVersion = "2.0";

// Decode one frame.
// - not JSON: kParseError, id null
// - not an object: kInvalidRequest, id null
// - non-string method: its JSON text, which matches no registered method
// - missing method: "" ; missing or null params: {} ; other params kept as sent
[[nodiscard]] core::Result<JsonRpcRequest, DecodeFailure> decode_request(const std::string& frame);

[[nodiscard]] nlohmann::json make_response(const nlohmann::json& id, const nlohmann::json& result);

[[nodiscard]] nlohmann::json make_error_response(const nlohmann::json& id, int code,
                                                 const std::string& message);

// Notifications carry no id and are never confused with responses.
[[nodiscard]] nlohmann::json make_notification(const std::string& method,
                                               const nlohmann::json& params);

}  // namespace simb::bridge
