#pragma once

#include "simb/bridge/handler_result.h"
#include "simb/bridge/protocol.h"

#include <nlohmann/json.hpp>

#include <exception>
#include <string>
#include <utility>

namespace simb::bridge::handlers {

[[nodiscard]] HandlerResult handler_failure(std::string message);

// guarded runs a handler body and converts any std::exception it throws into a
// handler failure, so handlers return an explicit result at their boundary.
template <typename Body>
[[nodiscard]] HandlerResult guarded(Body&& body) {
  try {
    return HandlerResult::ok(std::forward<Body>(body)());
  } catch (const std::exception& e) {
    return handler_failure(e.what());
  }
}

// require_string returns params[key] when it is a non-empty string.
// Otherwise throws std::invalid_argument with missing_message.
[[nodiscard]] std::string require_string(const nlohmann::json& params, const char* key,
                                         const std::string& missing_message);

// Like require_string, but an empty string is accepted.
[[nodiscard]] std::string require_string_allow_empty(const nlohmann::json& params, const char* key,
                                                     const std::string& missing_message);

// optional_string returns params[key] if present and not null, fallback otherwise.
// Throws std::invalid_argument if the value is present but not a string.
[[nodiscard]] std::string optional_string(const nlohmann::json& params, const char* key,
                                          const std::string& fallback = "");

}  // namespace simb::bridge::handlers
