#include "simb/bridge/frame_reader.h"
#include "simb/bridge/handlers/method_registry.h"
#include "simb/bridge/response_writer.h"
#include "simb/bridge/server_context.h"
#include "simb/bridge/server_loop.h"
#include "simb/bridge/session_state.h"
#include "simb/core/id_generator.h"
#include "simb/core/version.h"
#include "simb/identity/identity_provider.h"
#include "simb/identity/keystore.h"
#include "simb/storage/inmemory_contact_store.h"
#include "simb/storage/sqlite/sqlite_contact_store.h"
#include "simb/storage/sqlite/sqlite_db.h"

#include "config.h"
#include "startup_guard.h"
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

using namespace simb;

namespace {

// Opens (or creates) the contact database under the data directory.
// Runs on the first contact request, not at startup.
std::unique_ptr<storage::IContactStore> open_contact_store(const bridge_app::BridgeConfig& config,
                                                           core::IIdGenerator& id_gen) {
  if (config.contacts_backend == bridge_app::ContactsBackend::kInMemory) {
    return std::make_unique<storage::InMemoryContactStore>(id_gen);
  }

  const std::string db_file = (std::filesystem::path(config.data_dir) / "contacts.db").string();
  auto db_result = storage::sqlite::SqliteDb::open(db_file);
  if (!db_result.has_value()) {
    throw std::runtime_error(db_result.error());
  }
  auto db = db_result.value();
  auto schema_result = db->ensure_schema();
  if (!schema_result.has_value()) {
    throw std::runtime_error("Failed to initialize contact schema: " + schema_result.error());
  }
  std::cerr << "Opened contact database " << db_file << "\n";
  return std::make_unique<storage::sqlite::SqliteContactStore>(db, id_gen);
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Main
// ────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
  const auto config = bridge_app::parse_args(argc, argv);

  if (config.show_help) {
    std::cerr << bridge_app::usage(argc > 0 ? argv[0] : "sim_bridge");
    return 0;
  }

  // Validate config before emitting any startup output so no partial messages appear on error.
  const std::string config_error = bridge_app::validate_bridge_config(config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return 1;
  }

  // ── Startup diagnostic block ──────────────────────────────────────────────
  // stdout carries protocol frames only; everything else goes to stderr.
  std::cerr << "sim-bridge v" << core::kBuildVersion << "\n";
  std::cerr << "Data dir:    " << config.data_dir << "\n";
  std::cerr << "Contacts:    " << bridge_app::to_string(config.contacts_backend)
            << " (opened on first use)\n";
  if (config.contacts_backend == bridge_app::ContactsBackend::kInMemory) {
    std::cerr << "WARNING: Contacts are EPHEMERAL and will be LOST on process exit.\n";
  }
  std::cerr << "Keystore:    " << config.data_dir << "/keystore.enc (argon2i, "
            << config.kdf_blocks << " KiB)\n";
  std::cerr << "Network:     not attached\n";
  std::cerr << "Listening on stdio for JSON-RPC requests...\n";
  // ─────────────────────────────────────────────────────────────────────────

  core::UuidIdGenerator id_gen;
  identity::Ed25519IdentityProvider identity_provider;
  identity::FileKeyStore keystore(std::filesystem::path(config.data_dir) / "keystore.enc",
                                  identity::KdfParams{.nb_blocks = config.kdf_blocks});

  bridge::Services services{
      .identity_provider = identity_provider,
      .keystore = keystore,
      .id_gen = id_gen,
  };
  bridge::SessionState session(
      [&config, &id_gen]() { return open_contact_store(config, id_gen); });
  bridge::Lifecycle lifecycle;
  bridge::ServerContext ctx{.services = services, .session = session, .lifecycle = lifecycle};

  bridge::LoopExit exit_reason = bridge::LoopExit::kEndOfInput;
  try {
    const bridge::DispatchTable table = bridge::handlers::build_method_registry();
    bridge::QueuedFrameReader reader(std::make_unique<bridge::StreamFrameReader>(std::cin),
                                     config.frame_queue_capacity);
    bridge::ResponseWriter writer(std::cout);
    exit_reason = bridge::run_server_loop(reader, writer, table, ctx);
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 1;
  }

  std::cerr << "Bridge stopped: " << bridge::to_string(exit_reason) << "\n";
  return exit_reason == bridge::LoopExit::kOutputClosed ? 1 : 0;
}
