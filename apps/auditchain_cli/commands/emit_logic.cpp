#include "emit_logic.h"

#include "auditchain/domain/record_json.h"

#include <nlohmann/json.hpp>

#include "exit_codes.h"

int execute_emit(const auditchain::domain::AuditEventInput& event,
                 auditchain::ledger::AuditLedger& ledger, std::ostream& out, std::ostream& err) {
  auto result = ledger.emit(event);
  if (!result.has_value()) {
    return report_ledger_error(result.error(), err);
  }

  if (!result.value().has_value()) {
    out << nlohmann::json{{"recorded", false}}.dump(2) << "\n";
    return kExitOk;
  }

  out << auditchain::domain::audit_record_to_json(result.value().value()).dump(2) << "\n";
  return kExitOk;
}
