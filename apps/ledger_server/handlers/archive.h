#pragma once

#include <nlohmann/json.hpp>

#include "../jsonrpc_protocol.h"
#include "../method_handlers.h"
#include "../server_context.h"

namespace auditchain::server::handlers {

HandlerResult handle_archive(const JsonRpcRequest& req, ServerContext& ctx);

}  // namespace auditchain::server::handlers
