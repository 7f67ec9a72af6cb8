#pragma once

#include "auditchain/core/result.h"
#include "auditchain/domain/audit_record.h"
#include "auditchain/domain/chain_scope.h"
#include "auditchain/ledger/action_policy.h"
#include "auditchain/ledger/archive_manager.h"
#include "auditchain/ledger/chain_appender.h"
#include "auditchain/ledger/chain_verifier.h"
#include "auditchain/ledger/ledger_config.h"
#include "auditchain/shipping/log_shipper.h"
#include "auditchain/storage/ledger_store.h"

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace auditchain::ledger {

struct LedgerHealth {
  std::string status;                                // NOLINT(readability-identifier-naming)
  std::string audit_status;                          // NOLINT(readability-identifier-naming)
  std::optional<std::int64_t> audit_logs_size_bytes;  // NOLINT(readability-identifier-naming)
  std::string log_shipping_status;                   // NOLINT(readability-identifier-naming)
};

// AuditLedger is the entry point the surrounding application calls.
//
// emit() is EmitAuditEvent:
//   - the action name, workspace_id and details shape are validated and
//     details are sanitized; invalid input fails under either policy
//   - WriteConflict is retried up to append_attempts times with a fixed backoff
//   - a committed record is handed to the log shipper; shipping failure is
//     logged and never affects the result
//   - a critical action returns its append error; a best-effort action logs
//     it and returns ok(nullopt)
//
// Diagnostics go to `log` as WARNING lines.
class AuditLedger {
 public:
  AuditLedger(ChainAppender& appender, ArchiveManager& archiver, const storage::IChainReader& reader,
              shipping::ILogShipper& shipper, LedgerConfig config, std::ostream& log);

  [[nodiscard]] core::LedgerResult<std::optional<domain::AuditRecord>> emit(
      const domain::AuditEventInput& event);

  // limit is clamped to [1, max_verify_limit]; nullopt selects default_verify_limit.
  [[nodiscard]] core::LedgerResult<VerificationReport> verify(
      const std::optional<domain::ChainScope>& scope, std::optional<std::size_t> limit);

  // Every record of every scope, without the verify limits.
  [[nodiscard]] core::LedgerResult<VerificationReport> verify_all();

  [[nodiscard]] core::LedgerResult<ArchiveOutcome> archive(const ArchiveRequest& request);

  // query.limit is clamped to [1, max_query_limit]; 0 selects default_query_limit.
  [[nodiscard]] core::LedgerResult<std::vector<domain::AuditRecord>> query(
      storage::RecordQuery query) const;

  [[nodiscard]] LedgerHealth health() const;

  [[nodiscard]] AuditPolicy policy_for(const domain::AuditEventInput& event) const;

  [[nodiscard]] const LedgerConfig& config() const { return config_; }

 private:
  [[nodiscard]] core::LedgerResult<domain::AuditRecord> append_with_retry(
      const domain::AuditEventInput& event);
  void ship(const domain::AuditRecord& record);

  ChainAppender& appender_;
  ArchiveManager& archiver_;
  const storage::IChainReader& reader_;
  shipping::ILogShipper& shipper_;
  LedgerConfig config_;
  std::ostream& log_;
};

}  // namespace auditchain::ledger
