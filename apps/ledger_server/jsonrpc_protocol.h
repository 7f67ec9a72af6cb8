#pragma once

#include "auditchain/core/result.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace auditchain::server {

// JSON-RPC 2.0 message types
struct JsonRpcRequest {
  std::string jsonrpc{"2.0"};  // NOLINT(readability-identifier-naming)
  // Echoed verbatim (string, number or null). nullopt marks a notification.
  std::optional<nlohmann::json> id;  // NOLINT(readability-identifier-naming)
  std::string method;                // NOLINT(readability-identifier-naming)
  nlohmann::json params;             // NOLINT(readability-identifier-naming)
};

struct JsonRpcError {
  int code;                                     // NOLINT(readability-identifier-naming)
  std::string message;                          // NOLINT(readability-identifier-naming)
  nlohmann::json data = nlohmann::json::object();  // NOLINT(readability-identifier-naming)
};

// Error codes: JSON-RPC 2.0 reserved range, then ledger codes
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;
constexpr int kWriteConflict = -32001;
constexpr int kStorageError = -32002;
constexpr int kImmutabilityViolation = -32003;
constexpr int kArchivalInconsistency = -32004;

// Outcome of parsing one input line.
// A line that is not JSON yields kParseError; JSON that is not a request
// object with a string method yields kInvalidRequest.
using ParsedRequest = core::Result<JsonRpcRequest, JsonRpcError>;

ParsedRequest parse_request(const std::string& json_str);

// Create JSON-RPC success response
std::string make_response(const std::optional<nlohmann::json>& id, const nlohmann::json& result);

// Create JSON-RPC error response
std::string make_error_response(const std::optional<nlohmann::json>& id, const JsonRpcError& error);

// Maps a LedgerError to its JSON-RPC error.
// data carries {"error": "<LedgerErrorCode>", "retryable": bool}.
[[nodiscard]] JsonRpcError to_jsonrpc_error(const core::LedgerError& error);

[[nodiscard]] JsonRpcError invalid_params(const std::string& message);

}  // namespace auditchain::server
