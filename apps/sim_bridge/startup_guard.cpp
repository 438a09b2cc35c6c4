#include "startup_guard.h"

#include <filesystem>
#include <system_error>

namespace simb::bridge_app {

std::string validate_bridge_config(const BridgeConfig& config) {
  if (config.invalid_options > 0) {
    return "Error: " + std::to_string(config.invalid_options) +
           " command-line option(s) were missing a value or had an invalid value.\n"
           "       Run with --help for the accepted flags.";
  }

  if (config.frame_queue_capacity == 0) {
    return "Error: --frame-queue-capacity must be greater than zero";
  }

  if (config.kdf_blocks < kMinKdfBlocks) {
    return "Error: --kdf-blocks must be at least " + std::to_string(kMinKdfBlocks);
  }
  if (config.kdf_blocks > kMaxKdfBlocks) {
    return "Error: --kdf-blocks must be at most " + std::to_string(kMaxKdfBlocks);
  }

  // Side effect: the data directory exists once validation passes.
  std::error_code ec;
  std::filesystem::create_directories(config.data_dir, ec);
  if (ec) {
    return "Error: cannot create data directory '" + config.data_dir + "': " + ec.message();
  }
  if (!std::filesystem::is_directory(config.data_dir, ec)) {
    return "Error: data directory '" + config.data_dir + "' is not a directory";
  }

  return "";
}

}  // namespace simb::bridge_app
