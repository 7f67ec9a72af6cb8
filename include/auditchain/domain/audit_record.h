#pragma once

#include "auditchain/core/time.h"
#include "auditchain/domain/chain_scope.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace auditchain::domain {

// AuditEventInput is what a caller supplies to EmitAuditEvent / Append.
// Identity, timestamp and both hashes are assigned by the appender.
struct AuditEventInput {
  std::optional<std::string> actor_user_id;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> workspace_id;   // NOLINT(readability-identifier-naming)
  std::string action;                        // NOLINT(readability-identifier-naming)
  std::string resource_type;                 // NOLINT(readability-identifier-naming)
  std::string resource_id;                   // NOLINT(readability-identifier-naming)
  nlohmann::json details = nlohmann::json::object();  // NOLINT(readability-identifier-naming)
  std::optional<std::string> ip_address;              // NOLINT(readability-identifier-naming)
  std::optional<std::string> user_agent;              // NOLINT(readability-identifier-naming)
  // nullopt defers to the ActionPolicy classification.
  std::optional<bool> critical;  // NOLINT(readability-identifier-naming)

  [[nodiscard]] ChainScope scope() const { return ChainScope{workspace_id}; }
};

// AuditRecord is one immutable, hash-linked ledger entry.
//
// record_hash covers previous_hash, created_at, actor_user_id, action,
// resource_type, resource_id and workspace_id. details, ip_address and
// user_agent are stored but not hashed.
struct AuditRecord {
  std::string id;
  core::Timestamp created_at;
  std::optional<std::string> actor_user_id;
  std::optional<std::string> workspace_id;
  std::string action;
  std::string resource_type;
  std::string resource_id;
  nlohmann::json details = nlohmann::json::object();
  std::optional<std::string> ip_address;
  std::optional<std::string> user_agent;
  std::string previous_hash;
  std::string record_hash;

  [[nodiscard]] ChainScope scope() const { return ChainScope{workspace_id}; }
};

}  // namespace auditchain::domain
