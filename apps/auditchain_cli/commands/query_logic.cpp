#include "query_logic.h"

#include "auditchain/domain/record_json.h"

#include <nlohmann/json.hpp>

#include "exit_codes.h"

int execute_query(auditchain::ledger::AuditLedger& ledger,
                  const auditchain::storage::RecordQuery& query, std::ostream& out,
                  std::ostream& err) {
  auto result = ledger.query(query);
  if (!result.has_value()) {
    return report_ledger_error(result.error(), err);
  }

  nlohmann::json logs = nlohmann::json::array();
  for (const auto& record : result.value()) {
    logs.push_back(auditchain::domain::audit_record_to_json(record));
  }

  out << nlohmann::json{{"logs", logs}}.dump(2) << "\n";
  return kExitOk;
}
