#pragma once

#include <nlohmann/json.hpp>

#include <mutex>
#include <ostream>
#include <string>

namespace simb::bridge {

// encode_frame serializes one message as compact ASCII JSON followed by '\n'.
// Invalid UTF-8 in strings is replaced rather than thrown.
[[nodiscard]] std::string encode_frame(const nlohmann::json& message);

// ResponseWriter is the only writer of the protocol stream.
// Each call emits one complete line with a single write and flushes it, under a mutex.
// Write methods return false once the stream has failed (the parent stopped reading).
class ResponseWriter {
 public:
  explicit ResponseWriter(std::ostream& out) : out_(out) {}

  ResponseWriter(const ResponseWriter&) = delete;
  ResponseWriter& operator=(const ResponseWriter&) = delete;
  ResponseWriter(ResponseWriter&&) = delete;
  ResponseWriter& operator=(ResponseWriter&&) = delete;
  ~ResponseWriter() = default;

  [[nodiscard]] bool write(const nlohmann::json& message);
  [[nodiscard]] bool write_result(const nlohmann::json& id, const nlohmann::json& result);
  [[nodiscard]] bool write_error(const nlohmann::json& id, int code, const std::string& message);
  [[nodiscard]] bool write_notification(const std::string& method, const nlohmann::json& params);

 private:
  std::mutex mutex_;
  std::ostream& out_;
};

}  // namespace simb::bridge
