#include "config.h"

#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

namespace auditchain::server {

namespace {

// ────────────────────────────────────────────────────────────────
// Option Handlers
// ────────────────────────────────────────────────────────────────

bool handle_db(LedgerServerConfig& config, const std::string& value) {
  config.db_path = value;
  return true;
}

bool handle_separate_reader(LedgerServerConfig& config, const std::string& /*value*/) {
  config.separate_reader = true;
  return true;
}

bool handle_redis(LedgerServerConfig& config, const std::string& value) {
  config.redis_uri = value;
  return true;
}

bool handle_archive_dir(LedgerServerConfig& config, const std::string& value) {
  config.archive_dir = value;
  return true;
}

bool handle_positive_int(LedgerServerConfig& config, int& target, const char* flag,
                         const std::string& value) {
  const auto parsed = apps::parse_integer<int>(value);
  if (!parsed.has_value() || parsed.value() < 1) {
    std::cerr << "Invalid " << flag << ": " << value << " (must be a positive integer)\n";
    config.flags_valid = false;
    return false;
  }
  target = parsed.value();
  return true;
}

bool handle_lock_timeout(LedgerServerConfig& config, const std::string& value) {
  return handle_positive_int(config, config.lock_timeout_ms, "--lock-timeout-ms", value);
}

bool handle_append_attempts(LedgerServerConfig& config, const std::string& value) {
  return handle_positive_int(config, config.append_attempts, "--append-attempts", value);
}

bool handle_verify_on_startup(LedgerServerConfig& config, const std::string& value) {
  if (value == "off") {
    config.verify_on_startup = AuditChainVerifyMode::kOff;
    return true;
  }
  if (value == "warn") {
    config.verify_on_startup = AuditChainVerifyMode::kWarn;
    return true;
  }
  if (value == "fail") {
    config.verify_on_startup = AuditChainVerifyMode::kFail;
    return true;
  }
  std::cerr << "Invalid --verify-on-startup: " << value << " (valid: off, warn, fail)\n";
  config.flags_valid = false;
  return false;
}

// ────────────────────────────────────────────────────────────────
// Option Registry
// ────────────────────────────────────────────────────────────────

std::vector<apps::Option<LedgerServerConfig>> build_option_registry() {
  return {
      {"--db", true, "Path to SQLite database file", handle_db},
      {"--separate-reader", false, "Open a second connection for verification and queries",
       handle_separate_reader},
      {"--redis", true, "Redis URI for log shipping", handle_redis},
      {"--archive-dir", true, "Directory for JSONL archive files", handle_archive_dir},
      {"--lock-timeout-ms", true, "Longest wait for a chain lock", handle_lock_timeout},
      {"--append-attempts", true, "Append attempts on WriteConflict", handle_append_attempts},
      {"--verify-on-startup", true, "Chain verification at startup (off|warn|fail)",
       handle_verify_on_startup},
  };
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Parser
// ────────────────────────────────────────────────────────────────

LedgerServerConfig parse_args(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = build_option_registry();
  return apps::parse_options(argc, argv, options, 1, LedgerServerConfig{});
}

}  // namespace auditchain::server
