#include "verify.h"

#include "auditchain/domain/chain_scope.h"

#include "exit_codes.h"
#include "open_runtime.h"
#include "shared/arg_parser.h"
#include "verify_logic.h"
#include <cstddef>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct VerifyCliConfig {
  CliStoreConfig store;
  std::optional<auditchain::domain::ChainScope> scope;
  std::optional<std::size_t> limit;
  bool valid{true};
};

}  // namespace

int cmd_verify(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  using Cfg = VerifyCliConfig;
  const std::vector<auditchain::apps::Option<Cfg>> options = {
      {"--db", true, "Path to SQLite database file",
       [](Cfg& c, const std::string& v) {
         c.store.db_path = v;
         return true;
       }},
      {"--workspace", true, "Verify only this workspace's chain",
       [](Cfg& c, const std::string& v) {
         c.scope = auditchain::domain::ChainScope::workspace(v);
         return true;
       }},
      {"--global", false, "Verify only the global chain",
       [](Cfg& c, const std::string& /*v*/) {
         c.scope = auditchain::domain::ChainScope::global();
         return true;
       }},
      {"--limit", true, "Verify only the newest N records per scope (1..100000)",
       [](Cfg& c, const std::string& v) {
         c.limit = auditchain::apps::parse_integer<std::size_t>(v);
         if (!c.limit.has_value()) {
           std::cerr << "Invalid --limit: " << v << "\n";
           c.valid = false;
           return false;
         }
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

  return execute_verify(runtime->ledger(), config.scope, config.limit, std::cout, std::cerr);
}
