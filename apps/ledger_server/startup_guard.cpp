#include "startup_guard.h"

#include "auditchain/core/time.h"
#include "auditchain/shipping/redis_config.h"

namespace auditchain::server {

std::string validate_ledger_server_config(const LedgerServerConfig& config) {
  if (!config.flags_valid) {
    return "Error: invalid command-line flags (see messages above).";
  }

  // Validate Redis URI format before attempting to connect.
  if (config.redis_uri.has_value() &&
      !shipping::parse_redis_uri(config.redis_uri.value()).has_value()) {
    return "Error: --redis URI '" + config.redis_uri.value() +
           "' is not a valid Redis URI.\n"
           "       Accepted formats: tcp://host:port, redis://host:port/N, tcp://host\n"
           "       with optional ?stream=<key>&maxlen=<n>";
  }

  if (config.separate_reader && !config.db_path.has_value()) {
    return "Error: --separate-reader requires --db <path>.";
  }

  if (config.verify_on_startup == AuditChainVerifyMode::kFail && !config.db_path.has_value()) {
    return "Error: --verify-on-startup fail requires --db <path>.\n"
           "       An ephemeral in-memory ledger has no history to verify.";
  }

  return "";
}

bool run_startup_verification(AuditChainVerifyMode mode, ledger::AuditLedger& ledger,
                              std::ostream& log) {
  if (mode == AuditChainVerifyMode::kOff) {
    log << "Audit chain: startup verification off\n";
    return true;
  }

  // Startup verification scans the full chain of every scope.
  auto result = ledger.verify_all();
  if (!result.has_value()) {
    log << "Error: startup chain verification could not run: " << result.error().message
        << "\n";
    return false;
  }

  const auto& report = result.value();
  if (report.valid) {
    log << "Audit chain: verified " << report.records_checked << " record(s) in "
        << report.scopes_checked << " scope(s), no violations\n";
    return true;
  }

  for (const auto& finding : report.findings) {
    log << "WARNING: audit chain violation: record " << finding.record_id << " ("
        << core::format_iso8601_millis(finding.created_at) << "): " << finding.error_message
        << "\n";
  }

  if (mode == AuditChainVerifyMode::kFail) {
    log << "Error: " << report.findings.size()
        << " audit chain violation(s) found; refusing to start (--verify-on-startup fail)\n";
    return false;
  }
  return true;
}

}  // namespace auditchain::server
