#include "simb/bridge/handlers/method_registry.h"

#include "simb/bridge/handlers/contact_handlers.h"
#include "simb/bridge/handlers/identity_handlers.h"
#include "simb/bridge/handlers/lifecycle_handlers.h"
#include "simb/bridge/handlers/messaging_handlers.h"
#include "simb/bridge/handlers/network_handlers.h"

#include <string>
#include <unordered_map>
#include <utility>

namespace simb::bridge::handlers {

DispatchTable build_method_registry() {
  std::unordered_map<std::string, MethodHandler> handlers{
      // Identity
      {"generate_identity", handle_generate_identity},
      {"load_identity", handle_load_identity},
      {"export_identity", handle_export_identity},
      {"import_identity", handle_import_identity},
      // Contacts
      {"add_contact", handle_add_contact},
      {"remove_contact", handle_remove_contact},
      {"list_contacts", handle_list_contacts},
      {"verify_contact", handle_verify_contact},
      // Messaging
      {"send_message", handle_send_message},
      {"send_voice_message", handle_send_voice_message},
      {"poll_mailbox", handle_poll_mailbox},
      {"get_messages", handle_get_messages},
      // Network
      {"get_network_status", handle_get_network_status},
      {"configure_relay", handle_configure_relay},
      {"configure_mailbox", handle_configure_mailbox},
      // Lifecycle
      {"shutdown", handle_shutdown},
  };
  return DispatchTable(std::move(handlers));
}

}  // namespace simb::bridge::handlers
