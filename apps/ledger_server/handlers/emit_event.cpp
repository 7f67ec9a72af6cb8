#include "emit_event.h"

#include "auditchain/domain/record_json.h"

namespace auditchain::server::handlers {

using json = nlohmann::json;

// params: the event (action required; see audit_event_from_json).
// result: {"recorded": true, "record": {...}} or {"recorded": false} when a
// best-effort event could not be appended.
HandlerResult handle_emit_event(const JsonRpcRequest& req, ServerContext& ctx) {
  auto event = domain::audit_event_from_json(req.params);
  if (!event.has_value()) {
    return HandlerResult::err(invalid_params(event.error()));
  }

  auto emitted = ctx.ledger.emit(event.value());
  if (!emitted.has_value()) {
    return HandlerResult::err(to_jsonrpc_error(emitted.error()));
  }

  if (!emitted.value().has_value()) {
    return HandlerResult::ok(json{{"recorded", false}});
  }
  return HandlerResult::ok(json{
      {"recorded", true},
      {"record", domain::audit_record_to_json(emitted.value().value())},
  });
}

}  // namespace auditchain::server::handlers
