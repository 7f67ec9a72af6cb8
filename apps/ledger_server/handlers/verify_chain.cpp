#include "verify_chain.h"

#include "auditchain/domain/chain_scope.h"
#include "auditchain/ledger/report_json.h"

#include "params.h"
#include <optional>

namespace auditchain::server::handlers {

// params: {workspace_id?: string, global?: bool, limit?: int}
// Without workspace_id or global every scope is verified.
HandlerResult handle_verify_chain(const JsonRpcRequest& req, ServerContext& ctx) {
  auto workspace_id = optional_string_param(req.params, "workspace_id");
  if (!workspace_id.has_value()) {
    return HandlerResult::err(workspace_id.error());
  }
  auto global = bool_param(req.params, "global", false);
  if (!global.has_value()) {
    return HandlerResult::err(global.error());
  }
  auto limit = optional_int_param(req.params, "limit");
  if (!limit.has_value()) {
    return HandlerResult::err(limit.error());
  }

  if (workspace_id.value().has_value() && global.value()) {
    return HandlerResult::err(invalid_params("workspace_id and global are mutually exclusive"));
  }

  std::optional<domain::ChainScope> scope;
  if (workspace_id.value().has_value()) {
    scope = domain::ChainScope::workspace(workspace_id.value().value());
  } else if (global.value()) {
    scope = domain::ChainScope::global();
  }

  auto report = ctx.ledger.verify(scope, requested_limit(limit.value()));
  if (!report.has_value()) {
    return HandlerResult::err(to_jsonrpc_error(report.error()));
  }
  return HandlerResult::ok(ledger::verification_report_to_json(report.value()));
}

}  // namespace auditchain::server::handlers
