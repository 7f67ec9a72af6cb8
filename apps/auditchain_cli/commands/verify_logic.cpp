#include "verify_logic.h"

#include "auditchain/ledger/report_json.h"

#include "exit_codes.h"

int execute_verify(auditchain::ledger::AuditLedger& ledger,
                   const std::optional<auditchain::domain::ChainScope>& scope,
                   std::optional<std::size_t> limit, std::ostream& out, std::ostream& err) {
  auto result = ledger.verify(scope, limit);
  if (!result.has_value()) {
    return report_ledger_error(result.error(), err);
  }

  const auto& report = result.value();
  out << auditchain::ledger::verification_report_to_json(report).dump(2) << "\n";

  if (!report.valid) {
    err << "Chain verification failed: " << report.findings.size() << " invalid record(s)\n";
    return kExitViolations;
  }
  return kExitOk;
}
