#pragma once

#include "auditchain/core/result.h"
#include "auditchain/core/time.h"

#include <nlohmann/json.hpp>

#include "../jsonrpc_protocol.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace auditchain::server::handlers {

template <typename T>
using ParamResult = core::Result<T, JsonRpcError>;

// Absent or null yields nullopt; any other non-string is invalid params.
ParamResult<std::optional<std::string>> optional_string_param(const nlohmann::json& params,
                                                              const char* key);

// ISO 8601 UTC text (YYYY-MM-DD or YYYY-MM-DDTHH:MM:SS[.fff]Z).
ParamResult<std::optional<core::Timestamp>> optional_time_param(const nlohmann::json& params,
                                                                const char* key);

ParamResult<std::optional<std::int64_t>> optional_int_param(const nlohmann::json& params,
                                                            const char* key);

// Page/scan size as requested: 0 selects the default, negatives select 1.
// The ledger clamps the result to its maximum.
std::optional<std::size_t> requested_limit(std::optional<std::int64_t> value);

ParamResult<bool> bool_param(const nlohmann::json& params, const char* key, bool fallback);

}  // namespace auditchain::server::handlers
