#pragma once

#include "auditchain/core/result.h"
#include "auditchain/domain/archive_checkpoint.h"
#include "auditchain/domain/audit_record.h"
#include "auditchain/domain/finding.h"

#include <nlohmann/json.hpp>

#include <string>

namespace auditchain::domain {

// JSON forms used by the CLI, the JSON-RPC server, JSONL archive files and the
// Redis stream payload. Timestamps are rendered as YYYY-MM-DDTHH:MM:SS.mmmZ and
// nullable fields as JSON null.
[[nodiscard]] nlohmann::json audit_record_to_json(const AuditRecord& record);
[[nodiscard]] nlohmann::json checkpoint_to_json(const ArchiveCheckpoint& checkpoint);
[[nodiscard]] nlohmann::json finding_to_json(const Finding& finding);

// Inverse of audit_record_to_json. Fails on a missing field or malformed timestamp.
[[nodiscard]] core::Result<AuditRecord, std::string> audit_record_from_json(
    const nlohmann::json& j);

// Event input as sent to audit.emit. action is required; resource_type and
// resource_id default to ""; details defaults to {}; "critical" is optional.
[[nodiscard]] core::Result<AuditEventInput, std::string> audit_event_from_json(
    const nlohmann::json& j);

}  // namespace auditchain::domain
