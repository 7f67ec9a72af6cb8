#include "auditchain/ledger/audit_ledger.h"

#include <ostream>
#include <thread>
#include <utility>

namespace auditchain::ledger {

AuditLedger::AuditLedger(ChainAppender& appender, ArchiveManager& archiver,
                         const storage::IChainReader& reader, shipping::ILogShipper& shipper,
                         LedgerConfig config, std::ostream& log)
    : appender_(appender),
      archiver_(archiver),
      reader_(reader),
      shipper_(shipper),
      config_(std::move(config)),
      log_(log) {}

AuditPolicy AuditLedger::policy_for(const domain::AuditEventInput& event) const {
  if (event.critical.has_value()) {
    return event.critical.value() ? AuditPolicy::kCritical : AuditPolicy::kBestEffort;
  }
  return classify_action(event.action);
}

core::LedgerResult<std::optional<domain::AuditRecord>> AuditLedger::emit(
    const domain::AuditEventInput& event) {
  using R = core::LedgerResult<std::optional<domain::AuditRecord>>;

  // Malformed events are caller bugs and are rejected under either policy.
  if (!is_valid_action(event.action)) {
    return R::err(core::LedgerError{core::LedgerErrorCode::kInvalidInput,
                                    "invalid action name '" + event.action + "'"});
  }
  if (auto error = event_input_error(event); !error.empty()) {
    return R::err(core::LedgerError{core::LedgerErrorCode::kInvalidInput, std::move(error)});
  }

  domain::AuditEventInput sanitized = event;
  sanitized.details = sanitize_details(event.details);

  auto appended = append_with_retry(sanitized);
  if (!appended.has_value()) {
    const auto& error = appended.error();
    if (policy_for(event) == AuditPolicy::kCritical) {
      return R::err(error);
    }
    log_ << "WARNING: best-effort audit event '" << event.action << "' dropped ("
         << core::to_string(error.code) << "): " << error.message << "\n";
    return R::ok(std::nullopt);
  }

  ship(appended.value());
  return R::ok(std::move(appended.value()));
}

core::LedgerResult<domain::AuditRecord> AuditLedger::append_with_retry(
    const domain::AuditEventInput& event) {
  const int attempts = config_.append_attempts < 1 ? 1 : config_.append_attempts;

  for (int attempt = 1;; ++attempt) {
    auto result = appender_.append(event);
    if (result.has_value() || !core::is_retryable(result.error().code) || attempt >= attempts) {
      return result;
    }
    std::this_thread::sleep_for(config_.retry_backoff);
  }
}

void AuditLedger::ship(const domain::AuditRecord& record) {
  const auto shipped = shipper_.ship(record);
  if (!shipped.delivered) {
    log_ << "WARNING: log shipping failed for record " << record.id << ": " << shipped.error
         << "\n";
  }
}

core::LedgerResult<VerificationReport> AuditLedger::verify(
    const std::optional<domain::ChainScope>& scope, std::optional<std::size_t> limit) {
  if (scope.has_value() && !scope->is_valid()) {
    return core::ledger_error<VerificationReport>(core::LedgerErrorCode::kInvalidInput,
                                                  "workspace_id must not be empty");
  }
  const std::size_t effective =
      clamp_limit(limit, config_.default_verify_limit, config_.max_verify_limit);
  return verify_chain(reader_, scope, effective);
}

core::LedgerResult<VerificationReport> AuditLedger::verify_all() {
  return verify_chain(reader_, std::nullopt, std::nullopt);
}

core::LedgerResult<ArchiveOutcome> AuditLedger::archive(const ArchiveRequest& request) {
  return archiver_.archive(request);
}

core::LedgerResult<std::vector<domain::AuditRecord>> AuditLedger::query(
    storage::RecordQuery query) const {
  query.limit = clamp_limit(query.limit, config_.default_query_limit, config_.max_query_limit);
  return reader_.query(query);
}

LedgerHealth AuditLedger::health() const {
  LedgerHealth health;
  health.log_shipping_status = shipper_.status();

  const auto size = appender_.store().storage_size_bytes();
  if (size.has_value()) {
    health.audit_status = "ok";
    health.audit_logs_size_bytes = size.value();
  } else {
    health.audit_status = "error";
    log_ << "WARNING: audit store health check failed: " << size.error().message << "\n";
  }

  health.status = health.audit_status == "ok" ? "ok" : "degraded";
  return health;
}

}  // namespace auditchain::ledger
