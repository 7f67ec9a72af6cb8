#pragma once

#include "auditchain/core/result.h"

#include <ostream>

// Process exit codes shared by every auditchain_cli subcommand.
constexpr int kExitOk = 0;
constexpr int kExitError = 1;
// verify completed and found at least one integrity violation.
constexpr int kExitViolations = 2;

// Prints "Error: <Code>: <message>" and returns kExitError.
inline int report_ledger_error(const auditchain::core::LedgerError& error, std::ostream& err) {
  err << "Error: " << auditchain::core::to_string(error.code) << ": " << error.message << "\n";
  return kExitError;
}
