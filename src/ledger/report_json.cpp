#include "auditchain/ledger/report_json.h"

#include "auditchain/core/time.h"
#include "auditchain/domain/record_json.h"

namespace auditchain::ledger {

using json = nlohmann::json;

namespace {

json optional_timestamp(const std::optional<core::Timestamp>& ts) {
  if (ts.has_value()) {
    return core::format_iso8601_millis(ts.value());
  }
  return nullptr;
}

}  // namespace

json verification_report_to_json(const VerificationReport& report) {
  json out{
      {"valid", report.valid},
      {"records_checked", report.records_checked},
      {"scopes_checked", report.scopes_checked},
  };
  if (!report.findings.empty()) {
    out["invalid_records"] = json::array();
    for (const auto& finding : report.findings) {
      out["invalid_records"].push_back(domain::finding_to_json(finding));
    }
  }
  return out;
}

json archive_outcome_to_json(const ArchiveOutcome& outcome) {
  json out{
      {"dry_run", outcome.dry_run},
      {"records_archived", outcome.records_archived},
      {"oldest_archived", optional_timestamp(outcome.oldest_archived)},
      {"newest_archived", optional_timestamp(outcome.newest_archived)},
  };
  if (outcome.checkpoint.has_value()) {
    out["checkpoint"] = domain::checkpoint_to_json(outcome.checkpoint.value());
  } else {
    out["checkpoint"] = nullptr;
  }
  return out;
}

json health_to_json(const LedgerHealth& health) {
  json out{
      {"status", health.status},
      {"audit_status", health.audit_status},
      {"log_shipping_status", health.log_shipping_status},
  };
  if (health.audit_logs_size_bytes.has_value()) {
    out["audit_logs_size_bytes"] = health.audit_logs_size_bytes.value();
  } else {
    out["audit_logs_size_bytes"] = nullptr;
  }
  return out;
}

}  // namespace auditchain::ledger
