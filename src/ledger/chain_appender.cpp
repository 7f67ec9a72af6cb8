#include "auditchain/ledger/chain_appender.h"

#include "auditchain/ledger/record_hash.h"

namespace auditchain::ledger {

using core::LedgerErrorCode;
using domain::AuditRecord;

std::string event_input_error(const domain::AuditEventInput& event) {
  if (event.action.empty()) {
    return "audit event action must not be empty";
  }
  if (!event.scope().is_valid()) {
    return "workspace_id must not be empty; omit it for the global chain";
  }
  if (!event.details.is_null() && !event.details.is_object()) {
    return "details must be a JSON object";
  }
  return "";
}

ChainAppender::ChainAppender(storage::ILedgerStore& store, core::IClock& clock,
                             core::IIdGenerator& ids, AppenderOptions options)
    : store_(store), clock_(clock), ids_(ids), options_(options) {}

core::LedgerResult<AuditRecord> ChainAppender::append(const domain::AuditEventInput& event) {
  if (auto error = event_input_error(event); !error.empty()) {
    return core::ledger_error<AuditRecord>(LedgerErrorCode::kInvalidInput, error);
  }

  auto tx = store_.begin(event.scope(), options_.lock_timeout);
  if (!tx.has_value()) {
    return core::LedgerResult<AuditRecord>::err(tx.error());
  }

  auto record = append_in(*tx.value(), event);
  if (!record.has_value()) {
    return record;
  }

  auto committed = tx.value()->commit();
  if (!committed.has_value()) {
    return core::LedgerResult<AuditRecord>::err(committed.error());
  }
  return record;
}

core::LedgerResult<AuditRecord> ChainAppender::append_in(storage::ILedgerTransaction& tx,
                                                         const domain::AuditEventInput& event) {
  if (auto error = event_input_error(event); !error.empty()) {
    return core::ledger_error<AuditRecord>(LedgerErrorCode::kInvalidInput, error);
  }
  if (event.scope() != tx.scope()) {
    return core::ledger_error<AuditRecord>(
        LedgerErrorCode::kInvalidInput,
        "event scope " + domain::to_string(event.scope()) + " does not match transaction scope " +
            domain::to_string(tx.scope()));
  }

  auto tip = tx.read_tip();
  if (!tip.has_value()) {
    return core::LedgerResult<AuditRecord>::err(tip.error());
  }

  // Strictly increasing created_at keeps chain order equal to timestamp order.
  core::Timestamp created_at = clock_.now();
  const auto& tip_created = tip.value().created_at;
  if (tip_created.has_value() && created_at <= tip_created.value()) {
    created_at = tip_created.value() + std::chrono::milliseconds{1};
  }

  AuditRecord record;
  record.id = ids_.next();
  record.created_at = created_at;
  record.actor_user_id = event.actor_user_id;
  record.workspace_id = event.workspace_id;
  record.action = event.action;
  record.resource_type = event.resource_type;
  record.resource_id = event.resource_id;
  record.details = event.details.is_null() ? nlohmann::json::object() : event.details;
  record.ip_address = event.ip_address;
  record.user_agent = event.user_agent;
  record.previous_hash = tip.value().hash;
  record.record_hash = compute_record_hash(record);

  auto inserted = tx.insert_record(record);
  if (!inserted.has_value()) {
    return core::LedgerResult<AuditRecord>::err(inserted.error());
  }
  return core::LedgerResult<AuditRecord>::ok(std::move(record));
}

}  // namespace auditchain::ledger
