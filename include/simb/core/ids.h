#pragma once

#include <string>

namespace simb::core {

// Strong ID types. Vocabulary types that prevent mixing up identifiers in APIs.

struct ContactId {
  std::string value;
  auto operator<=>(const ContactId&) const = default;
};

struct MessageId {
  std::string value;
  auto operator<=>(const MessageId&) const = default;
};

}  // namespace simb::core
