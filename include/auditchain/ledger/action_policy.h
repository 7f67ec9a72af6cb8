#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace auditchain::ledger {

// Whether a failed append must fail the caller's operation.
enum class AuditPolicy {
  kCritical,    // append failure is returned to the caller
  kBestEffort,  // append failure is logged and swallowed
};

[[nodiscard]] constexpr std::string_view to_string(AuditPolicy policy) noexcept {
  return policy == AuditPolicy::kCritical ? "critical" : "best_effort";
}

// classify_action maps an action name to its policy.
//
// Mutations, authentication, token lifecycle, membership and administrative
// actions are critical, as is every *_denied action. Read-only access such as
// document.view is best effort, as is any action outside those namespaces.
// AuditEventInput::critical overrides the classification.
[[nodiscard]] AuditPolicy classify_action(std::string_view action);

// Action names are lowercase dotted paths of at least two segments,
// each of [a-z0-9_]+ (e.g. "document.view_denied"). At most 128 characters.
[[nodiscard]] bool is_valid_action(std::string_view action);

// sanitize_details returns a copy of details without raw content or secrets.
// Keys named content, body, password, token, secret (any case) are removed at
// every depth. null becomes {}. Callers reject non-object details before
// sanitizing (see event_input_error).
[[nodiscard]] nlohmann::json sanitize_details(const nlohmann::json& details);

}  // namespace auditchain::ledger
