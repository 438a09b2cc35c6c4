#include "simb/bridge/protocol.h"

namespace simb::bridge {

using json = nlohmann::json;

core::Result<JsonRpcRequest, DecodeFailure> decode_request(const std::string& frame) {
  using DecodeResult = core::Result<JsonRpcRequest, DecodeFailure>;

  json message;
  try {
    message = json::parse(frame);
  } catch (const json::parse_error& e) {
    return DecodeResult::err(
        DecodeFailure{nullptr, kParseError, std::string("Parse error: ") + e.what()});
  }

  if (!message.is_object()) {
    return DecodeResult::err(DecodeFailure{
        nullptr, kInvalidRequest, "Invalid request: expected a JSON object"});
  }

  JsonRpcRequest request;
  request.id = message.contains("id") ? message["id"] : json(nullptr);

  if (message.contains("method")) {
    // A non-string method keeps its JSON text so the lookup reports it as not found.
    const json& method = message["method"];
    request.method = method.is_string() ? method.get<std::string>() : method.dump();
  }

  // Non-object params are kept; the dispatcher rejects them once the method is known.
  if (message.contains("params") && !message["params"].is_null()) {
    request.params = message["params"];
  } else {
    request.params = json::object();
  }

  return DecodeResult::ok(std::move(request));
}

json make_response(const json& id, const json& result) {
  json response;
  response["jsonrpc"] = kJsonRpcVersion;
  response["id"] = id;
  response["result"] = result;
  return response;
}

json make_error_response(const json& id, int code, const std::string& message) {
  json response;
  response["jsonrpc"] = kJsonRpcVersion;
  response["id"] = id;
  response["error"] = {
      {"code", code},
      {"message", message},
  };
  return response;
}

json make_notification(const std::string& method, const json& params) {
  json notification;
  notification["jsonrpc"] = kJsonRpcVersion;
  notification["method"] = method;
  notification["params"] = params;
  return notification;
}

}  // namespace simb::bridge
