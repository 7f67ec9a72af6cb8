#pragma once

#include "auditchain/core/time.h"
#include "auditchain/domain/audit_record.h"

#include <optional>
#include <string>
#include <string_view>

namespace auditchain::ledger {

// previous_hash of the first record of a chain that no checkpoint precedes.
// 64 zero hex digits.
inline constexpr std::string_view kGenesisHash =
    "0000000000000000000000000000000000000000000000000000000000000000";

// HashFields is the exact set of inputs covered by record_hash.
struct HashFields {
  std::string_view previous_hash;                   // NOLINT(readability-identifier-naming)
  core::Timestamp created_at;                       // NOLINT(readability-identifier-naming)
  const std::optional<std::string>& actor_user_id;  // NOLINT(readability-identifier-naming)
  std::string_view action;                          // NOLINT(readability-identifier-naming)
  std::string_view resource_type;                   // NOLINT(readability-identifier-naming)
  std::string_view resource_id;                     // NOLINT(readability-identifier-naming)
  const std::optional<std::string>& workspace_id;   // NOLINT(readability-identifier-naming)
};

// canonical_hash_input builds the byte string that is hashed:
//
//   previous_hash|created_at|actor_user_id|action|resource_type|resource_id|workspace_id
//
// created_at is YYYY-MM-DDTHH:MM:SS.mmmZ in UTC; a null actor or workspace is
// the empty string. No trailing newline. This encoding is a storage contract:
// changing it invalidates every persisted record_hash.
[[nodiscard]] std::string canonical_hash_input(const HashFields& fields);

// compute_record_hash returns SHA-256(canonical_hash_input) as 64 lower-case hex chars.
// Pure and safe to call concurrently.
[[nodiscard]] std::string compute_record_hash(const HashFields& fields);

// Recomputes the hash of a stored record from its own fields and previous_hash.
[[nodiscard]] std::string compute_record_hash(const domain::AuditRecord& record);

// True for exactly 64 lower-case hex characters.
[[nodiscard]] bool is_hex_digest(std::string_view value) noexcept;

// record_format_error checks what a store requires before persisting a record:
// a non-empty id and action, a valid scope, and both hashes as hex digests.
// Returns "" when the record is well formed.
[[nodiscard]] std::string record_format_error(const domain::AuditRecord& record);

}  // namespace auditchain::ledger
