#include "emit.h"

#include "auditchain/domain/audit_record.h"

#include <nlohmann/json.hpp>

#include "emit_logic.h"
#include "exit_codes.h"
#include "open_runtime.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

struct EmitCliConfig {
  CliStoreConfig store;
  auditchain::domain::AuditEventInput event;
  bool valid{true};
};

bool set_details(EmitCliConfig& c, const std::string& v) {
  try {
    c.event.details = nlohmann::json::parse(v);
  } catch (const nlohmann::json::parse_error& e) {
    std::cerr << "Invalid --details JSON: " << e.what() << "\n";
    c.valid = false;
    return false;
  }
  if (!c.event.details.is_object()) {
    std::cerr << "Invalid --details: must be a JSON object\n";
    c.valid = false;
    return false;
  }
  return true;
}

}  // namespace

int cmd_emit(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  using Cfg = EmitCliConfig;
  const std::vector<auditchain::apps::Option<Cfg>> options = {
      {"--db", true, "Path to SQLite database file",
       [](Cfg& c, const std::string& v) {
         c.store.db_path = v;
         return true;
       }},
      {"--redis", true, "Redis URI for log shipping",
       [](Cfg& c, const std::string& v) {
         c.store.redis_uri = v;
         return true;
       }},
      {"--action", true, "Namespaced action, e.g. document.create",
       [](Cfg& c, const std::string& v) {
         c.event.action = v;
         return true;
       }},
      {"--actor", true, "Actor user id",
       [](Cfg& c, const std::string& v) {
         c.event.actor_user_id = v;
         return true;
       }},
      {"--workspace", true, "Workspace id (omit for the global chain)",
       [](Cfg& c, const std::string& v) {
         c.event.workspace_id = v;
         return true;
       }},
      {"--resource-type", true, "Resource type",
       [](Cfg& c, const std::string& v) {
         c.event.resource_type = v;
         return true;
       }},
      {"--resource-id", true, "Resource id",
       [](Cfg& c, const std::string& v) {
         c.event.resource_id = v;
         return true;
       }},
      {"--details", true, "Details JSON object", set_details},
      {"--ip", true, "Client IP address",
       [](Cfg& c, const std::string& v) {
         c.event.ip_address = v;
         return true;
       }},
      {"--user-agent", true, "Client user agent",
       [](Cfg& c, const std::string& v) {
         c.event.user_agent = v;
         return true;
       }},
      {"--critical", false, "Fail if the event cannot be recorded",
       [](Cfg& c, const std::string& /*v*/) {
         c.event.critical = true;
         return true;
       }},
      {"--best-effort", false, "Log and continue if the event cannot be recorded",
       [](Cfg& c, const std::string& /*v*/) {
         c.event.critical = false;
         return true;
       }},
  };
  auto config = auditchain::apps::parse_options(argc, argv, options, 2);

  if (!config.valid) {
    return kExitError;
  }
  if (config.event.action.empty()) {
    std::cerr << "Error: --action <name> is required\n";
    return kExitError;
  }

  auto runtime = open_runtime(config.store);
  if (!runtime) {
    return kExitError;
  }

  return execute_emit(config.event, runtime->ledger(), std::cout, std::cerr);
}
