#pragma once

#include <string_view>

namespace auditchain::ledger {

// Actions the ledger emits about itself.
inline constexpr std::string_view kActionMaintenanceStarted = "audit.maintenance_started";
inline constexpr std::string_view kActionMaintenanceEnded = "audit.maintenance_ended";
inline constexpr std::string_view kActionImmutabilityViolation = "audit.immutability_violation";
inline constexpr std::string_view kActionRecordsArchived = "audit.records_archived";

inline constexpr std::string_view kLedgerResourceType = "audit_log";

}  // namespace auditchain::ledger
