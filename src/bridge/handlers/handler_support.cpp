#include "simb/bridge/handlers/handler_support.h"

#include <stdexcept>

namespace simb::bridge::handlers {

using json = nlohmann::json;

HandlerResult handler_failure(std::string message) {
  return HandlerResult::err(HandlerError{.code = kServerError, .message = std::move(message)});
}

std::string require_string_allow_empty(const json& params, const char* key,
                                       const std::string& missing_message) {
  const auto it = params.find(key);
  if (it == params.end() || !it->is_string()) {
    throw std::invalid_argument(missing_message);
  }
  return it->get<std::string>();
}

std::string require_string(const json& params, const char* key,
                           const std::string& missing_message) {
  std::string value = require_string_allow_empty(params, key, missing_message);
  if (value.empty()) {
    throw std::invalid_argument(missing_message);
  }
  return value;
}

std::string optional_string(const json& params, const char* key, const std::string& fallback) {
  const auto it = params.find(key);
  if (it == params.end() || it->is_null()) {
    return fallback;
  }
  if (!it->is_string()) {
    throw std::invalid_argument(std::string("Parameter '") + key + "' must be a string");
  }
  return it->get<std::string>();
}

}  // namespace simb::bridge::handlers
