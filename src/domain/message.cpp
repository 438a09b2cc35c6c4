#include "simb/domain/message.h"

namespace simb::domain {

std::string_view to_string(MessageType type) {
  switch (type) {
    case MessageType::kText:
      return "text";
    case MessageType::kVoice:
      return "voice";
    case MessageType::kReceipt:
      return "receipt";
    case MessageType::kKeyExchange:
      return "key_exchange";
    case MessageType::kSessionReset:
      return "session_reset";
  }
  return "text";
}

std::string_view to_string(DeliveryStatus status) {
  switch (status) {
    case DeliveryStatus::kPending:
      return "pending";
    case DeliveryStatus::kSent:
      return "sent";
    case DeliveryStatus::kDelivered:
      return "delivered";
    case DeliveryStatus::kFailed:
      return "failed";
  }
  return "pending";
}

nlohmann::json message_to_json(const Message& message) {
  nlohmann::json j;
  j["id"] = message.message_id.value;
  j["contact_id"] = message.contact_id.value;
  j["is_outgoing"] = message.is_outgoing;
  j["type"] = std::string(to_string(message.type));
  if (message.text_content.has_value()) {
    j["text_content"] = message.text_content.value();
  }
  if (message.voice_data_path.has_value()) {
    j["voice_data_path"] = message.voice_data_path.value();
  }
  j["delivery_status"] = std::string(to_string(message.delivery_status));
  j["sequence_index"] = message.sequence_index;
  return j;
}

}  // namespace simb::domain
