#include "archive.h"

#include "auditchain/domain/chain_scope.h"
#include "auditchain/ledger/archive_manager.h"
#include "auditchain/ledger/report_json.h"

#include "params.h"

namespace auditchain::server::handlers {

// params: {workspace_id?: string, older_than?: timestamp, months?: int,
//          actor_user_id?: string, dry_run?: bool}
// older_than wins over months; with neither, the configured retention applies.
HandlerResult handle_archive(const JsonRpcRequest& req, ServerContext& ctx) {
  auto workspace_id = optional_string_param(req.params, "workspace_id");
  if (!workspace_id.has_value()) {
    return HandlerResult::err(workspace_id.error());
  }
  auto older_than = optional_time_param(req.params, "older_than");
  if (!older_than.has_value()) {
    return HandlerResult::err(older_than.error());
  }
  auto months = optional_int_param(req.params, "months");
  if (!months.has_value()) {
    return HandlerResult::err(months.error());
  }
  auto actor = optional_string_param(req.params, "actor_user_id");
  if (!actor.has_value()) {
    return HandlerResult::err(actor.error());
  }
  auto dry_run = bool_param(req.params, "dry_run", false);
  if (!dry_run.has_value()) {
    return HandlerResult::err(dry_run.error());
  }

  if (months.value().has_value() && (months.value().value() < 1 || months.value().value() > 1200)) {
    return HandlerResult::err(invalid_params("months must be between 1 and 1200"));
  }

  ledger::ArchiveRequest request;
  request.scope = domain::ChainScope{workspace_id.value()};
  request.actor_user_id = actor.value();
  request.dry_run = dry_run.value();
  if (older_than.value().has_value()) {
    request.older_than = older_than.value().value();
  } else {
    const int retention = months.value().has_value()
                              ? static_cast<int>(months.value().value())
                              : ctx.ledger.config().retention_months;
    request.older_than = ledger::retention_cutoff(ctx.clock.now(), retention);
  }

  auto outcome = ctx.ledger.archive(request);
  if (!outcome.has_value()) {
    return HandlerResult::err(to_jsonrpc_error(outcome.error()));
  }
  return HandlerResult::ok(ledger::archive_outcome_to_json(outcome.value()));
}

}  // namespace auditchain::server::handlers
