#include "internal/audit/audit_log.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/util/time.hpp"
#include "tests/support/test_doubles.hpp"

namespace {

using namespace std::chrono_literals;
using fleet::audit::AuditLog;
using fleet::registry::model::AuditEntry;

AuditEntry Entry(const std::string& action, const std::string& timestamp = {}) {
  AuditEntry entry;
  entry.user_id   = "u1";
  entry.username  = "admin";
  entry.action    = action;
  entry.ip        = "ipv4:127.0.0.1:5555";
  entry.timestamp = timestamp;
  return entry;
}

void TestRecordAppendsWithTimestamp() {
  auto     kv = std::make_shared<fleet::testing::CountingKeyValueStore>();
  AuditLog log(kv, 24h * 30);

  log.Record(Entry("node:create"));
  log.Record(Entry("node:delete"));

  const auto entries = log.List();
  assert(entries.size() == 2);
  assert(entries[0].action == "node:create");
  assert(entries[1].action == "node:delete");
  assert(entries[0].username == "admin");

  fleet::util::TimePoint at;
  assert(fleet::util::ParseIso8601(entries[0].timestamp, &at));
  assert(fleet::util::Now() - at < 1min);

  assert(kv->Get("audits")->find("\"userId\":\"u1\"") != std::string::npos);
}

void TestEntriesOlderThanRetentionArePruned() {
  auto     kv = std::make_shared<fleet::testing::CountingKeyValueStore>();
  AuditLog log(kv, 24h * 30);

  const auto now = fleet::util::Now();
  log.Record(Entry("node:update", fleet::util::ToIso8601(now - 24h * 31)));
  log.Record(Entry("node:update", fleet::util::ToIso8601(now - 24h * 2)));
  log.Record(Entry("node:configure"));

  const auto entries = log.List();
  assert(entries.size() == 2);
  assert(entries[0].timestamp == fleet::util::ToIso8601(now - 24h * 2));
  assert(entries[1].action == "node:configure");
}

void TestStoreFailureDoesNotThrow() {
  auto     kv = std::make_shared<fleet::testing::CountingKeyValueStore>();
  AuditLog log(kv, 24h);

  kv->fail_writes(true);
  log.Record(Entry("node:delete"));

  kv->fail_writes(false);
  assert(log.List().empty());
}

} // namespace

int main() {
  TestRecordAppendsWithTimestamp();
  TestEntriesOlderThanRetentionArePruned();
  TestStoreFailureDoesNotThrow();

  std::cout << "fleet_registry_unit_audit_log: pass\n";
  return 0;
}
