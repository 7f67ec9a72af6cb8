#include "auditchain/ledger/immutability_guard.h"

#include "auditchain/ledger/ledger_actions.h"

namespace auditchain::ledger {

using json = nlohmann::json;

namespace {

domain::AuditEventInput ledger_event(const domain::ChainScope& scope,
                                     const std::optional<std::string>& actor,
                                     std::string_view action, std::string resource_id,
                                     json details) {
  domain::AuditEventInput event;
  event.actor_user_id = actor;
  event.workspace_id = scope.workspace_id;
  event.action = std::string(action);
  event.resource_type = std::string(kLedgerResourceType);
  event.resource_id = std::move(resource_id);
  event.details = std::move(details);
  event.critical = true;
  return event;
}

}  // namespace

ImmutabilityGuard::ImmutabilityGuard(ChainAppender& appender, core::IIdGenerator& ids)
    : appender_(appender), ids_(ids) {}

core::LedgerResult<bool> ImmutabilityGuard::run_maintenance(storage::ILedgerTransaction& tx,
                                                            const MaintenanceRequest& request,
                                                            const MaintenanceFn& fn) {
  storage::MaintenanceWindow window(tx, ids_.next());

  json started_details = request.details;
  started_details["reason"] = request.reason;
  auto started = appender_.append_in(
      tx, ledger_event(tx.scope(), request.actor_user_id, kActionMaintenanceStarted, window.id(),
                       std::move(started_details)));
  if (!started.has_value()) {
    return core::LedgerResult<bool>::err(started.error());
  }

  auto outcome = fn(window);
  window.close();
  if (!outcome.has_value()) {
    return outcome;
  }

  auto ended = appender_.append_in(
      tx, ledger_event(tx.scope(), request.actor_user_id, kActionMaintenanceEnded, window.id(),
                       json{{"reason", request.reason}}));
  if (!ended.has_value()) {
    return core::LedgerResult<bool>::err(ended.error());
  }
  return core::LedgerResult<bool>::ok(true);
}

core::LedgerResult<domain::AuditRecord> ImmutabilityGuard::record_violation(
    const domain::ChainScope& scope, const std::optional<std::string>& actor_user_id,
    const std::string& detail) {
  return appender_.append(ledger_event(scope, actor_user_id, kActionImmutabilityViolation,
                                       domain::to_string(scope), json{{"detail", detail}}));
}

}  // namespace auditchain::ledger
