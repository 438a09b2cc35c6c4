#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

#include "simb/core/ids.h"

namespace simb::domain {

enum class MessageType {
  kText,
  kVoice,
  kReceipt,
  kKeyExchange,
  kSessionReset,
};

enum class DeliveryStatus {
  kPending,
  kSent,
  kDelivered,
  kFailed,
};

// Message carries no timestamp. Ordering within a conversation is the coarse
// sequence_index only.
struct Message {
  core::MessageId message_id;
  core::ContactId contact_id;
  bool is_outgoing{false};
  MessageType type{MessageType::kText};
  std::optional<std::string> text_content;
  std::optional<std::string> voice_data_path;
  DeliveryStatus delivery_status{DeliveryStatus::kPending};
  int sequence_index{0};
};

[[nodiscard]] std::string_view to_string(MessageType type);
[[nodiscard]] std::string_view to_string(DeliveryStatus status);

// Wire mapping. Only the content field matching the message type is emitted.
[[nodiscard]] nlohmann::json message_to_json(const Message& message);

}  // namespace simb::domain
