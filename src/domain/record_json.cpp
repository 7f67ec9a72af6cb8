#include "auditchain/domain/record_json.h"

#include <optional>

namespace auditchain::domain {

using json = nlohmann::json;

namespace {

json nullable(const std::optional<std::string>& value) {
  if (value.has_value()) {
    return value.value();
  }
  return nullptr;
}

std::optional<std::string> optional_string(const json& j, const char* key) {
  if (!j.contains(key) || j.at(key).is_null()) {
    return std::nullopt;
  }
  return j.at(key).get<std::string>();
}

}  // namespace

json audit_record_to_json(const AuditRecord& record) {
  return json{
      {"id", record.id},
      {"created_at", core::format_iso8601_millis(record.created_at)},
      {"actor_user_id", nullable(record.actor_user_id)},
      {"workspace_id", nullable(record.workspace_id)},
      {"action", record.action},
      {"resource_type", record.resource_type},
      {"resource_id", record.resource_id},
      {"details", record.details},
      {"ip_address", nullable(record.ip_address)},
      {"user_agent", nullable(record.user_agent)},
      {"previous_hash", record.previous_hash},
      {"record_hash", record.record_hash},
  };
}

json checkpoint_to_json(const ArchiveCheckpoint& checkpoint) {
  return json{
      {"id", checkpoint.id},
      {"last_record_id", checkpoint.last_record_id},
      {"last_record_created_at", core::format_iso8601_millis(checkpoint.last_record_created_at)},
      {"last_record_hash", checkpoint.last_record_hash},
      {"records_archived", checkpoint.records_archived},
      {"workspace_id", nullable(checkpoint.workspace_id)},
      {"archived_at", core::format_iso8601_millis(checkpoint.archived_at)},
      {"archive_location", nullable(checkpoint.archive_location)},
      {"archive_checksum", nullable(checkpoint.archive_checksum)},
      {"created_by", nullable(checkpoint.created_by)},
  };
}

json finding_to_json(const Finding& finding) {
  return json{
      {"id", finding.record_id},
      {"is_valid", finding.is_valid},
      {"error_message", finding.error_message},
      {"created_at", core::format_iso8601_millis(finding.created_at)},
      {"detail", finding.detail},
  };
}

core::Result<AuditRecord, std::string> audit_record_from_json(const json& j) {
  using R = core::Result<AuditRecord, std::string>;

  if (!j.is_object()) {
    return R::err("audit record must be a JSON object");
  }

  try {
    AuditRecord record;
    record.id = j.at("id").get<std::string>();

    const auto created_at = core::parse_iso8601(j.at("created_at").get<std::string>());
    if (!created_at.has_value()) {
      return R::err("malformed created_at for record " + record.id);
    }
    record.created_at = created_at.value();

    record.actor_user_id = optional_string(j, "actor_user_id");
    record.workspace_id = optional_string(j, "workspace_id");
    record.action = j.at("action").get<std::string>();
    record.resource_type = j.value("resource_type", "");
    record.resource_id = j.value("resource_id", "");
    record.details = j.value("details", json::object());
    record.ip_address = optional_string(j, "ip_address");
    record.user_agent = optional_string(j, "user_agent");
    record.previous_hash = j.at("previous_hash").get<std::string>();
    record.record_hash = j.at("record_hash").get<std::string>();
    return R::ok(std::move(record));
  } catch (const json::exception& e) {
    return R::err(std::string("malformed audit record: ") + e.what());
  }
}

core::Result<AuditEventInput, std::string> audit_event_from_json(const json& j) {
  using R = core::Result<AuditEventInput, std::string>;

  if (!j.is_object()) {
    return R::err("event must be a JSON object");
  }
  if (!j.contains("action") || !j.at("action").is_string()) {
    return R::err("missing required string field 'action'");
  }

  try {
    AuditEventInput event;
    event.actor_user_id = optional_string(j, "actor_user_id");
    event.workspace_id = optional_string(j, "workspace_id");
    event.action = j.at("action").get<std::string>();
    event.resource_type = j.value("resource_type", "");
    event.resource_id = j.value("resource_id", "");
    event.details = j.value("details", json::object());
    event.ip_address = optional_string(j, "ip_address");
    event.user_agent = optional_string(j, "user_agent");
    if (j.contains("critical") && !j.at("critical").is_null()) {
      event.critical = j.at("critical").get<bool>();
    }
    return R::ok(std::move(event));
  } catch (const json::exception& e) {
    return R::err(std::string("malformed event: ") + e.what());
  }
}

}  // namespace auditchain::domain
