#pragma once

#include "auditchain/core/id_generator.h"
#include "auditchain/core/result.h"
#include "auditchain/domain/audit_record.h"
#include "auditchain/ledger/chain_appender.h"
#include "auditchain/storage/ledger_store.h"
#include "auditchain/storage/maintenance_window.h"

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>

namespace auditchain::ledger {

struct MaintenanceRequest {
  std::optional<std::string> actor_user_id;           // NOLINT(readability-identifier-naming)
  std::string reason;                                 // NOLINT(readability-identifier-naming)
  nlohmann::json details = nlohmann::json::object();  // NOLINT(readability-identifier-naming)
};

// ImmutabilityGuard owns the only path by which committed records may be removed.
//
// Stores reject every update, and reject deletion unless the caller presents
// a MaintenanceWindow covering its transaction. The guard is the sole issuer of
// such windows, and brackets each one with audit.maintenance_started and
// audit.maintenance_ended records appended in the same transaction, so the
// maintenance itself is part of the chain it modifies.
class ImmutabilityGuard {
 public:
  using MaintenanceFn =
      std::function<core::LedgerResult<bool>(const storage::MaintenanceWindow& window)>;

  ImmutabilityGuard(ChainAppender& appender, core::IIdGenerator& ids);

  // Runs fn inside tx with an open window. The window is closed before this
  // returns, whatever fn does. On error nothing is committed by the guard;
  // the caller drops tx to roll back.
  [[nodiscard]] core::LedgerResult<bool> run_maintenance(storage::ILedgerTransaction& tx,
                                                         const MaintenanceRequest& request,
                                                         const MaintenanceFn& fn);

  // Appends audit.immutability_violation to scope in a fresh transaction.
  // Must not be called while the caller still holds a transaction on scope.
  [[nodiscard]] core::LedgerResult<domain::AuditRecord> record_violation(
      const domain::ChainScope& scope, const std::optional<std::string>& actor_user_id,
      const std::string& detail);

 private:
  ChainAppender& appender_;
  core::IIdGenerator& ids_;
};

}  // namespace auditchain::ledger
