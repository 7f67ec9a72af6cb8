#pragma once

#include "auditchain/core/result.h"

#include <nlohmann/json.hpp>

#include "jsonrpc_protocol.h"
#include "server_context.h"
#include <functional>
#include <string>
#include <unordered_map>

namespace auditchain::server {

using HandlerResult = core::Result<nlohmann::json, JsonRpcError>;
using MethodHandler = std::function<HandlerResult(const JsonRpcRequest& req, ServerContext& ctx)>;

// Methods: audit.emit, audit.verify, audit.archive, audit.query, health.
std::unordered_map<std::string, MethodHandler> build_method_registry();

// dispatch_request runs one parsed request and returns the response line.
// Returns "" for a notification (no id), which gets no response.
std::string dispatch_request(const JsonRpcRequest& request,
                             const std::unordered_map<std::string, MethodHandler>& registry,
                             ServerContext& ctx);

}  // namespace auditchain::server
