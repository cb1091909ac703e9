#include "internal/registry/node_record_store.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/kv/memory/memory_kv_store.hpp"
#include "tests/support/registry_harness.hpp"

namespace {

using fleet::registry::NodeRecordStore;
using fleet::registry::model::NodeRecord;
using fleet::registry::model::NodeStatus;
using fleet::testing::RegistryHarness;

void TestRecordRoundTripUsesCamelCaseJson() {
  auto            kv = std::make_shared<fleet::kv::memory::MemoryKeyValueStore>();
  NodeRecordStore store(kv);

  NodeRecord record;
  record.id             = "n1";
  record.name           = "alpha";
  record.address        = "10.0.0.1";
  record.port           = 3002;
  record.api_key        = "secret";
  record.status         = NodeStatus::Online;
  record.version_family = "1";
  record.docker         = true;
  store.Put(record);

  const auto raw = kv->Get("n1_node");
  assert(raw.has_value());
  assert(raw->find("\"apiKey\":\"secret\"") != std::string::npos);
  assert(raw->find("\"status\":\"Online\"") != std::string::npos);
  assert(raw->find("\"versionFamily\":\"1\"") != std::string::npos);

  const auto loaded = store.Get("n1");
  assert(loaded.has_value());
  assert(loaded->port == 3002);
  assert(loaded->status == NodeStatus::Online);
  assert(loaded->docker);
  assert(!loaded->remote);
}

void TestPortIsReadFromNumericString() {
  auto kv = std::make_shared<fleet::kv::memory::MemoryKeyValueStore>();
  kv->Set("legacy_node", R"({"id":"legacy","address":"h","port":"8080","apiKey":"k","status":"Offline"})");

  NodeRecordStore store(kv);
  const auto      loaded = store.Get("legacy");
  assert(loaded.has_value());
  assert(loaded->port == 8080);
  assert(loaded->status == NodeStatus::Offline);
}

void TestOutOfRangeNumbersDecodeSafely() {
  auto kv = std::make_shared<fleet::kv::memory::MemoryKeyValueStore>();
  kv->Set("wide_node", R"({"id":"wide","port":70000,"lastProbedAt":"-5","versionFamily":9.3e18})");
  kv->Set("huge_node", R"({"id":"huge","port":1e30,"lastProbedAt":"99999999999999999999999"})");

  NodeRecordStore store(kv);

  const auto wide = store.Get("wide");
  assert(wide->port == 65535);
  assert(wide->last_probed_at_ms == 0);
  assert(wide->version_family.rfind("9300000000000000000", 0) == 0);

  const auto huge = store.Get("huge");
  assert(huge->port == 0);
  assert(huge->last_probed_at_ms == 0);
}

void TestModifyMergesUnderLockAndSkipsMissing() {
  auto            kv = std::make_shared<fleet::kv::memory::MemoryKeyValueStore>();
  NodeRecordStore store(kv);

  assert(!store.Modify("absent", [](NodeRecord&) { return true; }).has_value());
  assert(!kv->Get(NodeRecordStore::RecordKey("absent")).has_value());

  NodeRecord record;
  record.id      = "m1";
  record.address = "10.0.0.1";
  store.Put(record);

  const auto skipped = store.Modify("m1", [](NodeRecord& current) {
    current.address = "ignored";
    return false;
  });
  assert(skipped->address == "10.0.0.1");
  assert(store.Get("m1")->address == "10.0.0.1");

  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&store] {
      for (int i = 0; i < 25; ++i) {
        store.Modify("m1", [](NodeRecord& current) {
          ++current.last_probed_at_ms;
          return true;
        });
      }
    });
  }
  for (auto& thread : threads) thread.join();
  assert(store.Get("m1")->last_probed_at_ms == 200);
}

void TestMissingRecordAndEmptyIndex() {
  NodeRecordStore store(std::make_shared<fleet::kv::memory::MemoryKeyValueStore>());
  assert(!store.Get("nope").has_value());
  assert(store.ListIds().empty());

  // idempotent
  store.Remove("nope");
  store.Remove("nope");
}

void TestSetIndexReplacesOrderAndRejectedMutationWritesNothing() {
  auto            kv = std::make_shared<fleet::kv::memory::MemoryKeyValueStore>();
  NodeRecordStore store(kv);

  store.SetIndex({"b", "a", "c"});
  assert((store.ListIndex() == std::vector<std::string>{"b", "a", "c"}));
  assert(kv->Get(NodeRecordStore::kIndexKey).value() == R"(["b","a","c"])");

  store.MutateIndex([](std::vector<std::string>& ids) {
    ids.clear();
    return false;
  });
  assert(store.ListIds().size() == 3);
}

void TestConcurrentIndexAppendsAreSerialized() {
  NodeRecordStore store(std::make_shared<fleet::kv::memory::MemoryKeyValueStore>());

  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&store, t] {
      for (int i = 0; i < 25; ++i) {
        const auto id = "t" + std::to_string(t) + "-" + std::to_string(i);
        store.MutateIndex([&](std::vector<std::string>& ids) {
          ids.push_back(id);
          return true;
        });
      }
    });
  }
  for (auto& thread : threads) thread.join();

  const auto ids = store.ListIds();
  assert(ids.size() == 200);
  assert(std::set<std::string>(ids.begin(), ids.end()).size() == 200);
}

void TestCreateDeleteReplayKeepsIndexConsistent() {
  RegistryHarness harness;

  std::mt19937             rng(7);
  std::vector<std::string> live;
  for (int step = 0; step < 120; ++step) {
    const bool create = live.empty() || rng() % 3 != 0;
    if (create) {
      // nodes are unreachable, which is fine for index bookkeeping
      const auto node = harness.node_registry->Create(RegistryHarness::Spec("10.1.0." + std::to_string(step % 250), 3000));
      live.push_back(node.id);
    } else {
      const auto victim = live[rng() % live.size()];
      harness.node_registry->Delete(victim, false);
      live.erase(std::remove(live.begin(), live.end(), victim), live.end());
    }
  }

  auto ids = harness.nodes->ListIds();
  assert(std::set<std::string>(ids.begin(), ids.end()).size() == ids.size());

  std::sort(ids.begin(), ids.end());
  std::sort(live.begin(), live.end());
  assert(ids == live);

  for (const auto& id : ids) {
    assert(harness.nodes->Get(id).has_value());
  }
}

void TestWriteFailureSurfacesAsError() {
  RegistryHarness harness;
  harness.kv->fail_writes(true);

  bool threw = false;
  try {
    harness.node_registry->Create(RegistryHarness::Spec("10.0.0.9", 3000));
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestRecordRoundTripUsesCamelCaseJson();
  TestPortIsReadFromNumericString();
  TestOutOfRangeNumbersDecodeSafely();
  TestModifyMergesUnderLockAndSkipsMissing();
  TestMissingRecordAndEmptyIndex();
  TestSetIndexReplacesOrderAndRejectedMutationWritesNothing();
  TestConcurrentIndexAppendsAreSerialized();
  TestCreateDeleteReplayKeepsIndexConsistent();
  TestWriteFailureSurfacesAsError();

  std::cout << "fleet_registry_unit_node_record_store: pass\n";
  return 0;
}
