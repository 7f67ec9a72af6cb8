#pragma once

#include "auditchain/domain/audit_record.h"
#include "auditchain/ledger/audit_ledger.h"

#include <ostream>

// execute_emit appends one event through the ledger and prints the committed
// record as JSON. A best-effort event whose append failed prints
// {"recorded": false} and still exits 0.
int execute_emit(const auditchain::domain::AuditEventInput& event,
                 auditchain::ledger::AuditLedger& ledger, std::ostream& out, std::ostream& err);
