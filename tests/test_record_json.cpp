#include "auditchain/core/time.h"
#include "auditchain/domain/finding.h"
#include "auditchain/domain/record_json.h"
#include "auditchain/ledger/record_hash.h"

#include <catch2/catch_test_macros.hpp>

using namespace auditchain;
using json = nlohmann::json;

static domain::AuditRecord sample_record() {
  domain::AuditRecord record;
  record.id = "rec-1";
  record.created_at = core::from_unix_millis(1768473000123);
  record.actor_user_id = "user-1";
  record.workspace_id = "ws-1";
  record.action = "document.create";
  record.resource_type = "document";
  record.resource_id = "doc-1";
  record.details = json{{"title", "Q3"}};
  record.previous_hash = std::string(ledger::kGenesisHash);
  record.record_hash = ledger::compute_record_hash(record);
  return record;
}

TEST_CASE("audit_record_to_json: field names and nulls", "[domain][json]") {
  const json j = domain::audit_record_to_json(sample_record());
  CHECK(j["id"] == "rec-1");
  CHECK(j["created_at"] == "2026-01-15T10:30:00.123Z");
  CHECK(j["workspace_id"] == "ws-1");
  CHECK(j["ip_address"].is_null());
  CHECK(j["user_agent"].is_null());
  CHECK(j["record_hash"] == "1f8531e55570b9b6cd6fbe619ef090eee4ee31b2c713477d048db2016499a0e5");
}

TEST_CASE("audit_record_from_json: restores a hash-verifiable record", "[domain][json]") {
  const auto original = sample_record();
  auto parsed = domain::audit_record_from_json(domain::audit_record_to_json(original));
  REQUIRE(parsed.has_value());
  CHECK(parsed.value().created_at == original.created_at);
  CHECK(parsed.value().details == original.details);
  CHECK(ledger::compute_record_hash(parsed.value()) == original.record_hash);
}

TEST_CASE("audit_record_from_json: malformed input is an error", "[domain][json]") {
  CHECK_FALSE(domain::audit_record_from_json(json::array()).has_value());
  CHECK_FALSE(domain::audit_record_from_json(json{{"id", "x"}}).has_value());

  json bad_time = domain::audit_record_to_json(sample_record());
  bad_time["created_at"] = "15/01/2026";
  CHECK_FALSE(domain::audit_record_from_json(bad_time).has_value());
}

TEST_CASE("audit_event_from_json: action is required", "[domain][json]") {
  auto event = domain::audit_event_from_json(
      json{{"action", "auth.login"}, {"actor_user_id", "u"}, {"critical", false}});
  REQUIRE(event.has_value());
  CHECK(event.value().action == "auth.login");
  CHECK(event.value().resource_type.empty());
  CHECK(event.value().details == json::object());
  CHECK(event.value().critical == std::optional<bool>{false});
  CHECK_FALSE(event.value().workspace_id.has_value());

  CHECK_FALSE(domain::audit_event_from_json(json::object()).has_value());
  CHECK_FALSE(domain::audit_event_from_json(json{{"action", 5}}).has_value());
  CHECK_FALSE(
      domain::audit_event_from_json(json{{"action", "a.b"}, {"critical", "yes"}}).has_value());
}

TEST_CASE("finding_to_json: stable error messages", "[domain][json]") {
  domain::Finding finding;
  finding.record_id = "rec-9";
  finding.reason = domain::FindingReason::kChainOriginNotFound;
  finding.error_message = std::string(domain::to_message(finding.reason));
  finding.created_at = core::from_unix_millis(0);

  const json j = domain::finding_to_json(finding);
  CHECK(j["id"] == "rec-9");
  CHECK(j["is_valid"] == false);
  CHECK(j["error_message"] == "Chain origin not found");
  CHECK(j["created_at"] == "1970-01-01T00:00:00.000Z");

  CHECK(domain::to_message(domain::FindingReason::kRecordHashMismatch) == "Record hash mismatch");
  CHECK(domain::to_message(domain::FindingReason::kPreviousHashMismatch) ==
        "Previous hash mismatch");
}
