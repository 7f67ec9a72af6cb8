#include "auditchain/ledger/record_hash.h"

#include "auditchain/core/sha256.h"

namespace auditchain::ledger {

namespace {

constexpr char kSeparator = '|';

}  // namespace

std::string canonical_hash_input(const HashFields& fields) {
  const std::string created_at = core::format_iso8601_millis(fields.created_at);
  const std::string_view actor =
      fields.actor_user_id.has_value() ? std::string_view{*fields.actor_user_id} : "";
  const std::string_view workspace =
      fields.workspace_id.has_value() ? std::string_view{*fields.workspace_id} : "";

  std::string out;
  out.reserve(fields.previous_hash.size() + created_at.size() + actor.size() +
              fields.action.size() + fields.resource_type.size() + fields.resource_id.size() +
              workspace.size() + 6);
  out.append(fields.previous_hash);
  out.push_back(kSeparator);
  out.append(created_at);
  out.push_back(kSeparator);
  out.append(actor);
  out.push_back(kSeparator);
  out.append(fields.action);
  out.push_back(kSeparator);
  out.append(fields.resource_type);
  out.push_back(kSeparator);
  out.append(fields.resource_id);
  out.push_back(kSeparator);
  out.append(workspace);
  return out;
}

std::string compute_record_hash(const HashFields& fields) {
  return core::sha256_hex(canonical_hash_input(fields));
}

std::string compute_record_hash(const domain::AuditRecord& record) {
  return compute_record_hash(HashFields{record.previous_hash, record.created_at,
                                        record.actor_user_id, record.action,
                                        record.resource_type, record.resource_id,
                                        record.workspace_id});
}

bool is_hex_digest(std::string_view value) noexcept {
  if (value.size() != 64) {
    return false;
  }
  for (const char c : value) {
    const bool digit = c >= '0' && c <= '9';
    const bool lower_hex = c >= 'a' && c <= 'f';
    if (!digit && !lower_hex) {
      return false;
    }
  }
  return true;
}

std::string record_format_error(const domain::AuditRecord& record) {
  if (record.id.empty()) {
    return "record id must not be empty";
  }
  if (record.action.empty()) {
    return "record " + record.id + " has an empty action";
  }
  if (!record.scope().is_valid()) {
    return "record " + record.id + " has an empty workspace_id";
  }
  if (!is_hex_digest(record.previous_hash)) {
    return "record " + record.id + " has a malformed previous_hash";
  }
  if (!is_hex_digest(record.record_hash)) {
    return "record " + record.id + " has a malformed record_hash";
  }
  return "";
}

}  // namespace auditchain::ledger
