#pragma once

#include "auditchain/ledger/audit_ledger.h"
#include "auditchain/storage/ledger_store.h"

#include <ostream>

// execute_query prints {"logs": [record...]} newest first.
int execute_query(auditchain::ledger::AuditLedger& ledger,
                  const auditchain::storage::RecordQuery& query, std::ostream& out,
                  std::ostream& err);
