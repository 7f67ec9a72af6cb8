#pragma once

#include "auditchain/domain/chain_scope.h"
#include "auditchain/ledger/audit_ledger.h"

#include <cstddef>
#include <optional>
#include <ostream>

// execute_verify prints the verification report as JSON.
// Returns kExitOk for a clean chain, kExitViolations when findings exist.
int execute_verify(auditchain::ledger::AuditLedger& ledger,
                   const std::optional<auditchain::domain::ChainScope>& scope,
                   std::optional<std::size_t> limit, std::ostream& out, std::ostream& err);
