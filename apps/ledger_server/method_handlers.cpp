#include "method_handlers.h"

#include "handlers/archive.h"
#include "handlers/emit_event.h"
#include "handlers/health.h"
#include "handlers/query_records.h"
#include "handlers/verify_chain.h"

namespace auditchain::server {

std::unordered_map<std::string, MethodHandler> build_method_registry() {
  return {
      {"audit.emit", handlers::handle_emit_event},
      {"audit.verify", handlers::handle_verify_chain},
      {"audit.archive", handlers::handle_archive},
      {"audit.query", handlers::handle_query_records},
      {"health", handlers::handle_health},
  };
}

std::string dispatch_request(const JsonRpcRequest& request,
                             const std::unordered_map<std::string, MethodHandler>& registry,
                             ServerContext& ctx) {
  auto it = registry.find(request.method);
  if (it == registry.end()) {
    if (!request.id.has_value()) {
      return "";
    }
    return make_error_response(request.id,
                               JsonRpcError{kMethodNotFound, "Unknown method: " + request.method});
  }

  auto result = it->second(request, ctx);
  if (!request.id.has_value()) {
    return "";
  }
  if (!result.has_value()) {
    return make_error_response(request.id, result.error());
  }
  return make_response(request.id, result.value());
}

}  // namespace auditchain::server
