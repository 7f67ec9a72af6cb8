#pragma once

#include "auditchain/ledger/archive_manager.h"
#include "auditchain/ledger/audit_ledger.h"

#include <ostream>

// execute_archive runs (or previews, with dry_run) one archival pass and
// prints the outcome as JSON.
int execute_archive(auditchain::ledger::AuditLedger& ledger,
                    const auditchain::ledger::ArchiveRequest& request, std::ostream& out,
                    std::ostream& err);
