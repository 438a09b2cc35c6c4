#include "simb/bridge/handlers/identity_handlers.h"

#include "simb/bridge/handlers/handler_support.h"

#include <iostream>
#include <stdexcept>

namespace simb::bridge::handlers {

using json = nlohmann::json;

namespace {

json identity_summary(const identity::Identity& id) {
  return json{
      {"fingerprint", id.fingerprint_hex()},
      {"public_key", id.public_key_hex()},
      {"is_loaded", true},
  };
}

}  // namespace

HandlerResult handle_generate_identity(const json& params, ServerContext& ctx) {
  return guarded([&]() -> json {
    const std::string passphrase = require_string(params, "passphrase", "Passphrase is required");

    identity::Identity generated = ctx.services.identity_provider.generate();
    auto saved = ctx.services.keystore.save(generated, passphrase);
    if (!saved.has_value()) {
      throw std::runtime_error(identity::keystore_error_message(saved.error()));
    }

    json summary = identity_summary(generated);
    ctx.session.replace_identity(std::move(generated));
    return summary;
  });
}

HandlerResult handle_load_identity(const json& params, ServerContext& ctx) {
  return guarded([&]() -> json {
    const std::string passphrase = require_string(params, "passphrase", "Passphrase is required");

    auto loaded = ctx.services.keystore.load(passphrase);
    if (!loaded.has_value()) {
      throw std::runtime_error(identity::keystore_error_message(loaded.error()));
    }

    json summary = identity_summary(loaded.value());
    ctx.session.replace_identity(std::move(loaded.value()));
    return summary;
  });
}

HandlerResult handle_export_identity(const json& /*params*/, ServerContext& ctx) {
  return guarded([&]() -> json {
    const identity::Identity& current = ctx.session.require_identity();
    const json export_data{
        {"public_key", current.public_key_hex()},
        {"fingerprint", current.fingerprint_hex()},
    };
    return json{{"export_data", export_data.dump()}};
  });
}

HandlerResult handle_import_identity(const json& params, ServerContext& ctx) {
  return guarded([&]() -> json {
    const std::string missing = "Import data and passphrase required";
    const std::string import_data = require_string(params, "import_data", missing);
    // The passphrase is required but unused: an imported identity carries no secret to seal.
    (void)require_string(params, "passphrase", missing);

    const json parsed = json::parse(import_data, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
      throw std::invalid_argument("Import data is not valid JSON");
    }
    const auto key = parsed.find("public_key");
    if (key == parsed.end() || !key->is_string()) {
      throw std::invalid_argument("Import data has no public_key");
    }

    identity::Identity imported =
        ctx.services.identity_provider.from_public_key_hex(key->get<std::string>());
    json summary = identity_summary(imported);
    ctx.session.replace_identity(std::move(imported));
    std::cerr << "Imported public identity " << summary["fingerprint"].get<std::string>() << "\n";
    return summary;
  });
}

}  // namespace simb::bridge::handlers
