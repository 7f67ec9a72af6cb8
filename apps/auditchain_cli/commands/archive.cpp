#include "archive.h"

#include "auditchain/core/time.h"
#include "auditchain/domain/chain_scope.h"
#include "auditchain/ledger/archive_manager.h"

#include "archive_logic.h"
#include "exit_codes.h"
#include "open_runtime.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct ArchiveCliConfig {
  CliStoreConfig store;
  auditchain::domain::ChainScope scope;
  int months{12};
  std::optional<auditchain::core::Timestamp> older_than;
  std::optional<std::string> actor;
  bool dry_run{false};
  bool valid{true};
};

}  // namespace

int cmd_archive(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  using Cfg = ArchiveCliConfig;
  const std::vector<auditchain::apps::Option<Cfg>> options = {
      {"--db", true, "Path to SQLite database file",
       [](Cfg& c, const std::string& v) {
         c.store.db_path = v;
         return true;
       }},
      {"--archive-dir", true, "Write archived records as JSONL under this directory",
       [](Cfg& c, const std::string& v) {
         c.store.archive_dir = v;
         return true;
       }},
      {"--workspace", true, "Archive this workspace's chain (default: global chain)",
       [](Cfg& c, const std::string& v) {
         c.scope = auditchain::domain::ChainScope::workspace(v);
         return true;
       }},
      {"--months", true, "Retention in months (default 12)",
       [](Cfg& c, const std::string& v) {
         const auto months = auditchain::apps::parse_integer<int>(v);
         if (!months.has_value() || months.value() < 1) {
           std::cerr << "Invalid --months: " << v << " (must be >= 1)\n";
           c.valid = false;
           return false;
         }
         c.months = months.value();
         return true;
       }},
      {"--older-than", true, "Explicit cutoff, YYYY-MM-DD or ISO 8601 UTC",
       [](Cfg& c, const std::string& v) {
         c.older_than = auditchain::core::parse_iso8601(v);
         if (!c.older_than.has_value()) {
           std::cerr << "Invalid --older-than: " << v << "\n";
           c.valid = false;
           return false;
         }
         return true;
       }},
      {"--actor", true, "Operator user id recorded on the checkpoint",
       [](Cfg& c, const std::string& v) {
         c.actor = v;
         return true;
       }},
      {"--dry-run", false, "Report what would be archived without changing anything",
       [](Cfg& c, const std::string& /*v*/) {
         c.dry_run = true;
         return true;
       }},
  };
  auto config = auditchain::apps::parse_options(argc, argv, options, 2);

  if (!config.valid) {
    return kExitError;
  }

  auto runtime = open_runtime(config.store);
  if (!runtime) {
    return kExitError;
  }

  auditchain::ledger::ArchiveRequest request;
  request.scope = config.scope;
  request.older_than = config.older_than.has_value()
                           ? config.older_than.value()
                           : auditchain::ledger::retention_cutoff(runtime->clock().now(),
                                                                  config.months);
  request.actor_user_id = config.actor;
  request.dry_run = config.dry_run;

  return execute_archive(runtime->ledger(), request, std::cout, std::cerr);
}
