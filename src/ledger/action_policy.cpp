#include "auditchain/ledger/action_policy.h"

#include <algorithm>
#include <array>
#include <cctype>

namespace auditchain::ledger {

namespace {

constexpr std::size_t kMaxActionLength = 128;

constexpr std::array<std::string_view, 12> kCriticalPrefixes = {
    "document.", "auth.",   "api_token.",  "workspace.",  "admin.",  "audit.",
    "session.",  "invite.", "membership.", "member.",     "user.",   "impersonation.",
};

constexpr std::array<std::string_view, 2> kBestEffortActions = {
    "document.view",
    "workspace.switch",
};

constexpr std::array<std::string_view, 5> kRedactedKeys = {
    "content", "body", "password", "token", "secret",
};

bool ends_with(std::string_view s, std::string_view suffix) {
  return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

bool is_redacted_key(std::string_view key) {
  std::string lower(key);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return std::find(kRedactedKeys.begin(), kRedactedKeys.end(), lower) != kRedactedKeys.end();
}

nlohmann::json strip(const nlohmann::json& value) {
  if (value.is_object()) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [key, child] : value.items()) {
      if (!is_redacted_key(key)) {
        out[key] = strip(child);
      }
    }
    return out;
  }
  if (value.is_array()) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& child : value) {
      out.push_back(strip(child));
    }
    return out;
  }
  return value;
}

}  // namespace

AuditPolicy classify_action(std::string_view action) {
  if (ends_with(action, "_denied")) {
    return AuditPolicy::kCritical;
  }
  if (std::find(kBestEffortActions.begin(), kBestEffortActions.end(), action) !=
      kBestEffortActions.end()) {
    return AuditPolicy::kBestEffort;
  }
  for (const auto prefix : kCriticalPrefixes) {
    if (action.substr(0, prefix.size()) == prefix) {
      return AuditPolicy::kCritical;
    }
  }
  return AuditPolicy::kBestEffort;
}

bool is_valid_action(std::string_view action) {
  if (action.empty() || action.size() > kMaxActionLength) {
    return false;
  }

  std::size_t segments = 1;
  std::size_t segment_length = 0;
  for (const char c : action) {
    if (c == '.') {
      if (segment_length == 0) {
        return false;
      }
      ++segments;
      segment_length = 0;
      continue;
    }
    const bool allowed = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
    if (!allowed) {
      return false;
    }
    ++segment_length;
  }

  return segment_length > 0 && segments >= 2;
}

nlohmann::json sanitize_details(const nlohmann::json& details) {
  if (details.is_null()) {
    return nlohmann::json::object();
  }
  return strip(details);
}

}  // namespace auditchain::ledger
