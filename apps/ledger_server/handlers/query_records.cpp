#include "query_records.h"

#include "auditchain/domain/record_json.h"
#include "auditchain/storage/ledger_store.h"

#include "params.h"

namespace auditchain::server::handlers {

using json = nlohmann::json;

namespace {

// Copies one optional string filter into target, or reports invalid params.
bool read_filter(const json& params, const char* key, std::optional<std::string>& target,
                 std::optional<JsonRpcError>& error) {
  auto value = optional_string_param(params, key);
  if (!value.has_value()) {
    error = value.error();
    return false;
  }
  target = value.value();
  return true;
}

}  // namespace

// params: {action?, resource_type?, resource_id?, actor_user_id?, workspace_id?,
//          start_date?, end_date?, limit?, offset?}
// result: {"logs": [record...]} newest first.
HandlerResult handle_query_records(const JsonRpcRequest& req, ServerContext& ctx) {
  storage::RecordQuery query;
  std::optional<JsonRpcError> error;

  if (!read_filter(req.params, "action", query.action, error) ||
      !read_filter(req.params, "resource_type", query.resource_type, error) ||
      !read_filter(req.params, "resource_id", query.resource_id, error) ||
      !read_filter(req.params, "actor_user_id", query.actor_user_id, error) ||
      !read_filter(req.params, "workspace_id", query.workspace_id, error)) {
    return HandlerResult::err(error.value());
  }

  auto start = optional_time_param(req.params, "start_date");
  if (!start.has_value()) {
    return HandlerResult::err(start.error());
  }
  auto end = optional_time_param(req.params, "end_date");
  if (!end.has_value()) {
    return HandlerResult::err(end.error());
  }
  auto limit = optional_int_param(req.params, "limit");
  if (!limit.has_value()) {
    return HandlerResult::err(limit.error());
  }
  auto offset = optional_int_param(req.params, "offset");
  if (!offset.has_value()) {
    return HandlerResult::err(offset.error());
  }

  query.start = start.value();
  query.end = end.value();
  query.limit = requested_limit(limit.value()).value_or(0);
  query.offset = offset.value().has_value() && offset.value().value() > 0
                     ? static_cast<std::size_t>(offset.value().value())
                     : 0;

  auto records = ctx.ledger.query(query);
  if (!records.has_value()) {
    return HandlerResult::err(to_jsonrpc_error(records.error()));
  }

  json logs = json::array();
  for (const auto& record : records.value()) {
    logs.push_back(domain::audit_record_to_json(record));
  }
  return HandlerResult::ok(json{{"logs", logs}});
}

}  // namespace auditchain::server::handlers
