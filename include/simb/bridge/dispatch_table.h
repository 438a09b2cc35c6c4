#pragma once

#include "simb/bridge/handler_result.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace simb::bridge {

struct ServerContext;

using MethodHandler =
    std::function<HandlerResult(const nlohmann::json& params, ServerContext& ctx)>;

// DispatchTable is the fixed method-name -> handler mapping.
// It is populated once at construction and offers no way to add or replace entries.
class DispatchTable {
 public:
  // Throws std::invalid_argument for an empty method name or an empty handler.
  explicit DispatchTable(std::unordered_map<std::string, MethodHandler> handlers);

  // nullptr when the method is not registered.
  [[nodiscard]] const MethodHandler* find(const std::string& method) const;

  [[nodiscard]] bool contains(const std::string& method) const { return find(method) != nullptr; }
  [[nodiscard]] std::size_t size() const { return handlers_.size(); }

  // Registered names, sorted.
  [[nodiscard]] std::vector<std::string> method_names() const;

 private:
  const std::unordered_map<std::string, MethodHandler> handlers_;
};

}  // namespace simb::bridge
