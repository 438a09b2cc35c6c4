#include "simb/bridge/response_writer.h"

#include "simb/bridge/protocol.h"

namespace simb::bridge {

std::string encode_frame(const nlohmann::json& message) {
  std::string line = message.dump(-1, ' ', true, nlohmann::json::error_handler_t::replace);
  line.push_back('\n');
  return line;
}

bool ResponseWriter::write(const nlohmann::json& message) {
  const std::string line = encode_frame(message);

  std::lock_guard<std::mutex> lock(mutex_);
  if (!out_) {
    return false;
  }
  out_.write(line.data(), static_cast<std::streamsize>(line.size()));
  out_.flush();
  return static_cast<bool>(out_);
}

bool ResponseWriter::write_result(const nlohmann::json& id, const nlohmann::json& result) {
  return write(make_response(id, result));
}

bool ResponseWriter::write_error(const nlohmann::json& id, int code, const std::string& message) {
  return write(make_error_response(id, code, message));
}

bool ResponseWriter::write_notification(const std::string& method, const nlohmann::json& params) {
  return write(make_notification(method, params));
}

}  // namespace simb::bridge
