#include "config.h"

#include "shared/arg_parser.h"

#include <charconv>
#include <iostream>
#include <limits>
#include <sstream>
#include <vector>

namespace simb::bridge_app {

namespace {

// ────────────────────────────────────────────────────────────────
// Option Handlers
// ────────────────────────────────────────────────────────────────

// Parses a whole decimal token; rejects signs, trailing text, and overflow.
template <typename Unsigned>
bool parse_unsigned(const std::string& value, Unsigned& out) {
  if (value.empty()) {
    return false;
  }
  unsigned long long parsed = 0;
  const char* first = value.data();
  // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  const char* last = first + value.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc{} || ptr != last || parsed > std::numeric_limits<Unsigned>::max()) {
    return false;
  }
  out = static_cast<Unsigned>(parsed);
  return true;
}

bool handle_data_dir(BridgeConfig& config, const std::string& value) {
  if (value.empty()) {
    std::cerr << "Invalid --data-dir: path must not be empty\n";
    return false;
  }
  config.data_dir = value;
  return true;
}

bool handle_contacts_backend(BridgeConfig& config, const std::string& value) {
  if (value == "sqlite") {
    config.contacts_backend = ContactsBackend::kSqlite;
    return true;
  }
  if (value == "inmemory") {
    config.contacts_backend = ContactsBackend::kInMemory;
    return true;
  }
  std::cerr << "Invalid --contacts-backend: " << value << " (valid: sqlite, inmemory)\n";
  return false;
}

bool handle_frame_queue_capacity(BridgeConfig& config, const std::string& value) {
  if (!parse_unsigned(value, config.frame_queue_capacity)) {
    std::cerr << "Invalid --frame-queue-capacity: " << value << "\n";
    return false;
  }
  return true;
}

bool handle_kdf_blocks(BridgeConfig& config, const std::string& value) {
  if (!parse_unsigned(value, config.kdf_blocks)) {
    std::cerr << "Invalid --kdf-blocks: " << value << "\n";
    return false;
  }
  return true;
}

bool handle_help(BridgeConfig& config, const std::string& /*value*/) {
  config.show_help = true;
  return true;
}

// ────────────────────────────────────────────────────────────────
// Option Registry
// ────────────────────────────────────────────────────────────────

std::vector<apps::Option<BridgeConfig>> build_option_registry() {
  return {
      {"--data-dir", true, "Working data directory, created if absent (default: data)",
       handle_data_dir},
      {"--contacts-backend", true, "Contact persistence (sqlite|inmemory, default: sqlite)",
       handle_contacts_backend},
      {"--frame-queue-capacity", true, "Frames buffered ahead of dispatch (default: 64)",
       handle_frame_queue_capacity},
      {"--kdf-blocks", true,
       "Keystore Argon2i memory cost in KiB (default: 65536, min: 8, max: 4194304)",
       handle_kdf_blocks},
      {"--help", false, "Print this help and exit", handle_help},
  };
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Parser
// ────────────────────────────────────────────────────────────────

BridgeConfig parse_args(int argc, char* argv[]) {
  auto parsed = apps::parse_options<BridgeConfig>(argc, argv, build_option_registry());
  parsed.config.invalid_options = parsed.failures;
  return parsed.config;
}

std::string usage(const std::string& program) {
  std::ostringstream out;
  out << "Usage: " << program << " [options]\n"
      << "Serves newline-delimited JSON-RPC requests on stdin and writes responses to stdout.\n\n"
      << "Options:\n";
  for (const auto& opt : build_option_registry()) {
    out << "  " << opt.name << (opt.requires_value ? " <value>" : "") << "\n"
        << "      " << opt.description << "\n";
  }
  return out.str();
}

const char* to_string(ContactsBackend backend) {
  switch (backend) {
    case ContactsBackend::kSqlite:
      return "sqlite";
    case ContactsBackend::kInMemory:
      return "inmemory";
  }
  return "unknown";
}

}  // namespace simb::bridge_app
