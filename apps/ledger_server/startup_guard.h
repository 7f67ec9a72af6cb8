#pragma once

#include "auditchain/ledger/audit_ledger.h"

#include "config.h"
#include <ostream>
#include <string>

namespace auditchain::server {

// validate_ledger_server_config checks startup preconditions for the server.
//
// Returns: "" on success, non-empty error message on failure.
// Caller is responsible for printing the error and exiting with code 1.
//
// Preconditions checked (first failure is returned):
// - every flag value was accepted by its handler
// - if redis_uri is present, parse_redis_uri() must succeed (format valid)
// - --separate-reader requires --db
// - --verify-on-startup fail requires --db (an empty in-memory chain proves nothing)
[[nodiscard]] std::string validate_ledger_server_config(const LedgerServerConfig& config);

// run_startup_verification verifies every scope according to mode.
// Returns false when the server must refuse to start: kFail with findings, or
// a verification that could not run under kWarn or kFail.
[[nodiscard]] bool run_startup_verification(AuditChainVerifyMode mode,
                                            ledger::AuditLedger& ledger, std::ostream& log);

}  // namespace auditchain::server
