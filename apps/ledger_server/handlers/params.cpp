#include "params.h"

namespace auditchain::server::handlers {

namespace {

bool absent(const nlohmann::json& params, const char* key) {
  return !params.contains(key) || params.at(key).is_null();
}

}  // namespace

ParamResult<std::optional<std::string>> optional_string_param(const nlohmann::json& params,
                                                              const char* key) {
  using R = ParamResult<std::optional<std::string>>;
  if (absent(params, key)) {
    return R::ok(std::nullopt);
  }
  if (!params.at(key).is_string()) {
    return R::err(invalid_params(std::string(key) + " must be a string"));
  }
  return R::ok(params.at(key).get<std::string>());
}

ParamResult<std::optional<core::Timestamp>> optional_time_param(const nlohmann::json& params,
                                                                const char* key) {
  using R = ParamResult<std::optional<core::Timestamp>>;
  auto text = optional_string_param(params, key);
  if (!text.has_value()) {
    return R::err(text.error());
  }
  if (!text.value().has_value()) {
    return R::ok(std::nullopt);
  }
  const auto parsed = core::parse_iso8601(text.value().value());
  if (!parsed.has_value()) {
    return R::err(invalid_params(std::string(key) + " must be an ISO 8601 UTC timestamp"));
  }
  return R::ok(parsed);
}

ParamResult<std::optional<std::int64_t>> optional_int_param(const nlohmann::json& params,
                                                            const char* key) {
  using R = ParamResult<std::optional<std::int64_t>>;
  if (absent(params, key)) {
    return R::ok(std::nullopt);
  }
  if (!params.at(key).is_number_integer()) {
    return R::err(invalid_params(std::string(key) + " must be an integer"));
  }
  return R::ok(params.at(key).get<std::int64_t>());
}

std::optional<std::size_t> requested_limit(std::optional<std::int64_t> value) {
  if (!value.has_value() || value.value() == 0) {
    return std::nullopt;
  }
  if (value.value() < 0) {
    return std::size_t{1};
  }
  return static_cast<std::size_t>(value.value());
}

ParamResult<bool> bool_param(const nlohmann::json& params, const char* key, bool fallback) {
  using R = ParamResult<bool>;
  if (absent(params, key)) {
    return R::ok(fallback);
  }
  if (!params.at(key).is_boolean()) {
    return R::err(invalid_params(std::string(key) + " must be a boolean"));
  }
  return R::ok(params.at(key).get<bool>());
}

}  // namespace auditchain::server::handlers
