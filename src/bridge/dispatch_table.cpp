#include "simb/bridge/dispatch_table.h"

#include <algorithm>
#include <stdexcept>

namespace simb::bridge {

namespace {

std::unordered_map<std::string, MethodHandler> checked(
    std::unordered_map<std::string, MethodHandler> handlers) {
  for (const auto& [name, handler] : handlers) {
    if (name.empty()) {
      throw std::invalid_argument("method name must not be empty");
    }
    if (!handler) {
      throw std::invalid_argument("handler for " + name + " is empty");
    }
  }
  return handlers;
}

}  // namespace

DispatchTable::DispatchTable(std::unordered_map<std::string, MethodHandler> handlers)
    : handlers_(checked(std::move(handlers))) {}

const MethodHandler* DispatchTable::find(const std::string& method) const {
  auto it = handlers_.find(method);
  if (it == handlers_.end()) {
    return nullptr;
  }
  return &it->second;
}

std::vector<std::string> DispatchTable::method_names() const {
  std::vector<std::string> names;
  names.reserve(handlers_.size());
  for (const auto& [name, handler] : handlers_) {
    names.push_back(name);
  }
  std::sort(names.begin(), names.end());
  return names;
}

}  // namespace simb::bridge
