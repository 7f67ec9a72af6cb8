#include "jsonrpc_protocol.h"

namespace auditchain::server {

namespace {

nlohmann::json id_or_null(const std::optional<nlohmann::json>& id) {
  if (id.has_value()) {
    return id.value();
  }
  return nullptr;
}

int code_for(core::LedgerErrorCode code) {
  switch (code) {
    case core::LedgerErrorCode::kWriteConflict:
      return kWriteConflict;
    case core::LedgerErrorCode::kStorageError:
      return kStorageError;
    case core::LedgerErrorCode::kImmutabilityViolation:
      return kImmutabilityViolation;
    case core::LedgerErrorCode::kArchivalInconsistency:
      return kArchivalInconsistency;
    case core::LedgerErrorCode::kInvalidInput:
      return kInvalidParams;
  }
  return kInternalError;
}

}  // namespace

ParsedRequest parse_request(const std::string& json_str) {
  nlohmann::json json;
  try {
    json = nlohmann::json::parse(json_str);
  } catch (const nlohmann::json::parse_error&) {
    return ParsedRequest::err(JsonRpcError{kParseError, "Invalid JSON"});
  }

  if (!json.is_object()) {
    return ParsedRequest::err(JsonRpcError{kInvalidRequest, "Request must be a JSON object"});
  }

  JsonRpcRequest request;
  if (json.contains("id")) {
    const auto& id = json["id"];
    if (!id.is_string() && !id.is_number_integer() && !id.is_null()) {
      return ParsedRequest::err(JsonRpcError{kInvalidRequest, "id must be a string or integer"});
    }
    request.id = id;
  }

  if (!json.contains("method") || !json["method"].is_string()) {
    return ParsedRequest::err(JsonRpcError{kInvalidRequest, "method must be a string"});
  }

  request.jsonrpc = json.value("jsonrpc", "2.0");
  request.method = json["method"].get<std::string>();
  request.params = json.value("params", nlohmann::json::object());
  if (!request.params.is_object()) {
    return ParsedRequest::err(JsonRpcError{kInvalidRequest, "params must be an object"});
  }

  return ParsedRequest::ok(std::move(request));
}

std::string make_response(const std::optional<nlohmann::json>& id, const nlohmann::json& result) {
  nlohmann::json response;
  response["jsonrpc"] = "2.0";
  response["id"] = id_or_null(id);
  response["result"] = result;
  return response.dump();
}

std::string make_error_response(const std::optional<nlohmann::json>& id,
                                const JsonRpcError& error) {
  nlohmann::json response;
  response["jsonrpc"] = "2.0";
  response["id"] = id_or_null(id);
  response["error"] = {
      {"code", error.code},
      {"message", error.message},
      {"data", error.data},
  };
  return response.dump();
}

JsonRpcError to_jsonrpc_error(const core::LedgerError& error) {
  return JsonRpcError{
      code_for(error.code),
      error.message,
      {
          {"error", std::string(core::to_string(error.code))},
          {"retryable", core::is_retryable(error.code)},
      },
  };
}

JsonRpcError invalid_params(const std::string& message) {
  return JsonRpcError{kInvalidParams, message};
}

}  // namespace auditchain::server
