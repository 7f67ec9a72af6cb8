#pragma once

#include "auditchain/ledger/archive_manager.h"
#include "auditchain/ledger/audit_ledger.h"
#include "auditchain/ledger/chain_verifier.h"

#include <nlohmann/json.hpp>

namespace auditchain::ledger {

// {valid, records_checked, scopes_checked, invalid_records: [finding...]}
// invalid_records is present only when findings exist.
[[nodiscard]] nlohmann::json verification_report_to_json(const VerificationReport& report);

// {dry_run, records_archived, oldest_archived, newest_archived, checkpoint}
[[nodiscard]] nlohmann::json archive_outcome_to_json(const ArchiveOutcome& outcome);

// {status, audit_status, audit_logs_size_bytes, log_shipping_status}
[[nodiscard]] nlohmann::json health_to_json(const LedgerHealth& health);

}  // namespace auditchain::ledger
