#pragma once

#include "auditchain/core/clock.h"
#include "auditchain/core/id_generator.h"
#include "auditchain/core/result.h"
#include "auditchain/domain/audit_record.h"
#include "auditchain/storage/ledger_store.h"

#include <chrono>
#include <string>

namespace auditchain::ledger {

struct AppenderOptions {
  // Longest wait for a scope lock before failing with kWriteConflict.
  std::chrono::milliseconds lock_timeout{2000};  // NOLINT(readability-identifier-naming)
};

// event_input_error returns "" for an appendable event, else why it is not:
// an empty action, an empty workspace_id, or details that are neither null
// nor a JSON object.
[[nodiscard]] std::string event_input_error(const domain::AuditEventInput& event);

// ChainAppender is the only component that creates AuditRecords.
//
// Each append reads the scope tip inside an exclusive transaction, assigns
// created_at = max(now, tip + 1ms), links previous_hash to the tip, computes
// record_hash and inserts. The tip is never cached across calls.
class ChainAppender {
 public:
  ChainAppender(storage::ILedgerStore& store, core::IClock& clock, core::IIdGenerator& ids,
                AppenderOptions options = {});

  // Opens a transaction on the event's scope, appends and commits.
  // Errors: kWriteConflict (lock timeout or competing link), kStorageError,
  //         kInvalidInput (see event_input_error).
  [[nodiscard]] core::LedgerResult<domain::AuditRecord> append(
      const domain::AuditEventInput& event);

  // Appends inside a transaction the caller already holds. The caller commits.
  // The event must belong to tx.scope().
  [[nodiscard]] core::LedgerResult<domain::AuditRecord> append_in(
      storage::ILedgerTransaction& tx, const domain::AuditEventInput& event);

  [[nodiscard]] storage::ILedgerStore& store() { return store_; }
  [[nodiscard]] const AppenderOptions& options() const { return options_; }

 private:
  storage::ILedgerStore& store_;
  core::IClock& clock_;
  core::IIdGenerator& ids_;
  AppenderOptions options_;
};

}  // namespace auditchain::ledger
