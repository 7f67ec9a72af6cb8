#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <optional>

namespace auditchain::ledger {

// LedgerConfig carries the tunables of the Audit Ledger facade.
struct LedgerConfig {
  std::chrono::milliseconds lock_timeout{2000};  // NOLINT(readability-identifier-naming)
  int append_attempts{3};                        // NOLINT(readability-identifier-naming)
  std::chrono::milliseconds retry_backoff{25};   // NOLINT(readability-identifier-naming)

  std::size_t default_verify_limit{10000};  // NOLINT(readability-identifier-naming)
  std::size_t max_verify_limit{100000};     // NOLINT(readability-identifier-naming)
  std::size_t default_query_limit{100};     // NOLINT(readability-identifier-naming)
  std::size_t max_query_limit{1000};        // NOLINT(readability-identifier-naming)

  int retention_months{12};  // NOLINT(readability-identifier-naming)
};

// Clamp a caller-supplied limit to [1, max]; nullopt or 0 selects the default.
[[nodiscard]] inline std::size_t clamp_limit(std::optional<std::size_t> requested,
                                             std::size_t default_limit, std::size_t max_limit) {
  if (!requested.has_value() || requested.value() == 0) {
    return std::min(default_limit, max_limit);
  }
  return std::clamp<std::size_t>(requested.value(), 1, max_limit);
}

}  // namespace auditchain::ledger
