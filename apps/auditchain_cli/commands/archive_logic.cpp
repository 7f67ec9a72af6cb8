#include "archive_logic.h"

#include "auditchain/core/time.h"
#include "auditchain/domain/chain_scope.h"
#include "auditchain/ledger/report_json.h"

#include "exit_codes.h"

int execute_archive(auditchain::ledger::AuditLedger& ledger,
                    const auditchain::ledger::ArchiveRequest& request, std::ostream& out,
                    std::ostream& err) {
  err << (request.dry_run ? "Dry run: " : "") << "archiving "
      << auditchain::domain::to_string(request.scope) << " records older than "
      << auditchain::core::format_iso8601_millis(request.older_than) << "\n";

  auto result = ledger.archive(request);
  if (!result.has_value()) {
    return report_ledger_error(result.error(), err);
  }

  out << auditchain::ledger::archive_outcome_to_json(result.value()).dump(2) << "\n";
  return kExitOk;
}
