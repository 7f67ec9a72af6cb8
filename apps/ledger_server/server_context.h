#pragma once

#include "auditchain/core/clock.h"
#include "auditchain/ledger/audit_ledger.h"

#include "config.h"

namespace auditchain::server {

// ServerContext holds all process-lifetime service references passed to every method handler.
// All references must remain valid for the lifetime of run_server_loop().
struct ServerContext {
  ledger::AuditLedger& ledger;  // NOLINT(readability-identifier-naming)
  core::IClock& clock;          // NOLINT(readability-identifier-naming)
  LedgerServerConfig& config;   // NOLINT(readability-identifier-naming)
};

}  // namespace auditchain::server
