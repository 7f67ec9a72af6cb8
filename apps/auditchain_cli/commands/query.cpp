#include "query.h"

#include "auditchain/core/time.h"
#include "auditchain/storage/ledger_store.h"

#include "exit_codes.h"
#include "open_runtime.h"
#include "query_logic.h"
#include "shared/arg_parser.h"
#include <cstddef>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct QueryCliConfig {
  CliStoreConfig store;
  auditchain::storage::RecordQuery query;
  bool valid{true};
};

bool set_time(QueryCliConfig& c, std::optional<auditchain::core::Timestamp>& target,
              const char* flag, const std::string& v) {
  target = auditchain::core::parse_iso8601(v);
  if (!target.has_value()) {
    std::cerr << "Invalid " << flag << ": " << v << "\n";
    c.valid = false;
    return false;
  }
  return true;
}

bool set_count(QueryCliConfig& c, std::size_t& target, const char* flag, const std::string& v) {
  const auto parsed = auditchain::apps::parse_integer<std::size_t>(v);
  if (!parsed.has_value()) {
    std::cerr << "Invalid " << flag << ": " << v << "\n";
    c.valid = false;
    return false;
  }
  target = parsed.value();
  return true;
}

}  // namespace

int cmd_query(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  using Cfg = QueryCliConfig;
  const std::vector<auditchain::apps::Option<Cfg>> options = {
      {"--db", true, "Path to SQLite database file",
       [](Cfg& c, const std::string& v) {
         c.store.db_path = v;
         return true;
       }},
      {"--action", true, "Filter by action",
       [](Cfg& c, const std::string& v) {
         c.query.action = v;
         return true;
       }},
      {"--resource-type", true, "Filter by resource type",
       [](Cfg& c, const std::string& v) {
         c.query.resource_type = v;
         return true;
       }},
      {"--resource-id", true, "Filter by resource id",
       [](Cfg& c, const std::string& v) {
         c.query.resource_id = v;
         return true;
       }},
      {"--actor", true, "Filter by actor user id",
       [](Cfg& c, const std::string& v) {
         c.query.actor_user_id = v;
         return true;
       }},
      {"--workspace", true, "Filter by workspace id",
       [](Cfg& c, const std::string& v) {
         c.query.workspace_id = v;
         return true;
       }},
      {"--start", true, "Earliest created_at (inclusive)",
       [](Cfg& c, const std::string& v) { return set_time(c, c.query.start, "--start", v); }},
      {"--end", true, "Latest created_at (inclusive)",
       [](Cfg& c, const std::string& v) { return set_time(c, c.query.end, "--end", v); }},
      {"--limit", true, "Maximum records (1..1000, default 100)",
       [](Cfg& c, const std::string& v) { return set_count(c, c.query.limit, "--limit", v); }},
      {"--offset", true, "Records to skip",
       [](Cfg& c, const std::string& v) { return set_count(c, c.query.offset, "--offset", v); }},
  };
  auto config = auditchain::apps::parse_options(argc, argv, options, 2);

  if (!config.valid) {
    return kExitError;
  }

  auto runtime = open_runtime(config.store);
  if (!runtime) {
    return kExitError;
  }

  return execute_query(runtime->ledger(), config.query, std::cout, std::cerr);
}
