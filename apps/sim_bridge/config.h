#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace simb::bridge_app {

enum class ContactsBackend {
  kSqlite,    // NOLINT(readability-identifier-naming)
  kInMemory,  // NOLINT(readability-identifier-naming)
};

// BridgeConfig holds all parsed startup flags for the bridge.
// Every field has an explicit default.
struct BridgeConfig {
  std::string data_dir{"data"};  // NOLINT(readability-identifier-naming)
  ContactsBackend contacts_backend{  // NOLINT(readability-identifier-naming)
                                   ContactsBackend::kSqlite};
  std::size_t frame_queue_capacity{64};  // NOLINT(readability-identifier-naming)
  std::uint32_t kdf_blocks{65536};       // NOLINT(readability-identifier-naming)
  bool show_help{false};                 // NOLINT(readability-identifier-naming)
  // Number of flags whose value was missing or rejected.
  int invalid_options{0};  // NOLINT(readability-identifier-naming)
};

BridgeConfig parse_args(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// usage returns the help text listing every flag.
[[nodiscard]] std::string usage(const std::string& program);

[[nodiscard]] const char* to_string(ContactsBackend backend);

}  // namespace simb::bridge_app
