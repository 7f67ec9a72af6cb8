#pragma once

#include "auditchain/core/time.h"

#include <string>
#include <string_view>

namespace auditchain::domain {

enum class FindingReason {
  kRecordHashMismatch,
  kPreviousHashMismatch,
  kChainOriginNotFound,
};

// Finding reports one integrity violation on one record.
// Only violations are produced, so is_valid is always false.
struct Finding {
  std::string record_id;      // NOLINT(readability-identifier-naming)
  bool is_valid{false};       // NOLINT(readability-identifier-naming)
  std::string error_message;  // NOLINT(readability-identifier-naming)
  FindingReason reason{FindingReason::kRecordHashMismatch};  // NOLINT(readability-identifier-naming)
  core::Timestamp created_at;  // NOLINT(readability-identifier-naming)
  std::string detail;          // NOLINT(readability-identifier-naming)
};

// Stable error_message text for each reason:
//   "Record hash mismatch", "Previous hash mismatch", "Chain origin not found".
[[nodiscard]] std::string_view to_message(FindingReason reason) noexcept;

}  // namespace auditchain::domain
