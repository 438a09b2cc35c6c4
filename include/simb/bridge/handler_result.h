#pragma once

#include "simb/core/result.h"

#include <nlohmann/json.hpp>

#include <string>

namespace simb::bridge {

// HandlerError is a failure scoped to one request. message is a short description
// suitable for the parent; it never contains a trace.
struct HandlerError {
  int code;             // NOLINT(readability-identifier-naming)
  std::string message;  // NOLINT(readability-identifier-naming)
};

using HandlerResult = core::Result<nlohmann::json, HandlerError>;

}  // namespace simb::bridge
