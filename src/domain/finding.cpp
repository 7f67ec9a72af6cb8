#include "auditchain/domain/finding.h"

namespace auditchain::domain {

std::string_view to_message(const FindingReason reason) noexcept {
  switch (reason) {
    case FindingReason::kRecordHashMismatch:
      return "Record hash mismatch";
    case FindingReason::kPreviousHashMismatch:
      return "Previous hash mismatch";
    case FindingReason::kChainOriginNotFound:
      return "Chain origin not found";
  }
  return "Unknown finding";
}

}  // namespace auditchain::domain
