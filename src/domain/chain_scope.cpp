#include "auditchain/domain/chain_scope.h"

namespace auditchain::domain {

std::string to_string(const ChainScope& scope) {
  if (scope.is_global()) {
    return "global";
  }
  return "workspace:" + scope.workspace_id.value();
}

}  // namespace auditchain::domain
