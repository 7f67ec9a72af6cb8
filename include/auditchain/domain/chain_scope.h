#pragma once

#include <optional>
#include <string>

namespace auditchain::domain {

// ChainScope identifies one independent hash chain.
// Each workspace has its own chain; events without a workspace form the
// tenant-global chain (workspace_id == nullopt).
struct ChainScope {
  std::optional<std::string> workspace_id;  // NOLINT(readability-identifier-naming)

  [[nodiscard]] static ChainScope global() { return ChainScope{}; }
  [[nodiscard]] static ChainScope workspace(std::string id) { return ChainScope{std::move(id)}; }

  [[nodiscard]] bool is_global() const { return !workspace_id.has_value(); }

  // A workspace id is never empty: the canonical hash input encodes the
  // global chain's null workspace as "".
  [[nodiscard]] bool is_valid() const { return is_global() || !workspace_id->empty(); }

  bool operator==(const ChainScope&) const = default;
  auto operator<=>(const ChainScope&) const = default;
};

// "global" or "workspace:<id>", for diagnostics and JSON output.
[[nodiscard]] std::string to_string(const ChainScope& scope);

}  // namespace auditchain::domain
