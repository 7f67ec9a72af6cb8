#include "health.h"

#include "auditchain/ledger/report_json.h"

namespace auditchain::server::handlers {

HandlerResult handle_health(const JsonRpcRequest& /*req*/, ServerContext& ctx) {
  return HandlerResult::ok(ledger::health_to_json(ctx.ledger.health()));
}

}  // namespace auditchain::server::handlers
