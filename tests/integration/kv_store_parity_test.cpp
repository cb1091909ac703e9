#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/kv/api/kv_store.hpp"
#include "internal/kv/memory/memory_kv_store.hpp"
#include "internal/kv/sqlite/sqlite_db.hpp"
#include "internal/kv/sqlite/sqlite_kv_store.hpp"
#include "internal/registry/node_record_store.hpp"

#if FLEET_DB_POSTGRES
#include "internal/kv/postgres/pg_kv_store.hpp"
#include "internal/kv/postgres/pg_pool.hpp"
#endif

namespace {

using fleet::kv::KeyValueStore;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                         name;
  std::function<std::shared_ptr<KeyValueStore>()>     make_store;
  bool                                                supports_restart = false;
  std::function<void()>                               cleanup;
};

void VerifyGetSetDelete(KeyValueStore& kv, const std::string& prefix) {
  const auto key = prefix + "-key";

  assert(!kv.Get(key).has_value());

  assert(kv.Set(key, R"({"a":1})"));
  assert(kv.Get(key).value() == R"({"a":1})");

  // upsert replaces the whole value
  assert(kv.Set(key, "[]"));
  assert(kv.Get(key).value() == "[]");

  assert(kv.Delete(key));
  assert(!kv.Get(key).has_value());

  // deleting a missing key is not an error
  assert(kv.Delete(key));
}

void VerifyLargeAndUnicodeValues(KeyValueStore& kv, const std::string& prefix) {
  const std::string big(256 * 1024, 'x');
  assert(kv.Set(prefix + "-big", big));
  assert(kv.Get(prefix + "-big").value() == big);

  const std::string unicode = R"({"name":"nœud ☃","quote":"it's"})";
  assert(kv.Set(prefix + "-unicode", unicode));
  assert(kv.Get(prefix + "-unicode").value() == unicode);
}

void VerifyConcurrentWritersOnDistinctKeys(KeyValueStore& kv, const std::string& prefix) {
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&kv, &prefix, t] {
      for (int i = 0; i < 20; ++i) {
        const auto result = kv.Set(prefix + "-c" + std::to_string(t) + "-" + std::to_string(i), std::to_string(i));
        assert(result);
      }
    });
  }
  for (auto& thread : threads) thread.join();

  for (int t = 0; t < 4; ++t) {
    assert(kv.Get(prefix + "-c" + std::to_string(t) + "-19").value() == "19");
  }
}

void VerifyRegistryOnBackend(std::shared_ptr<KeyValueStore> kv, const std::string& prefix) {
  fleet::registry::NodeRecordStore store(kv);

  fleet::registry::model::NodeRecord node;
  node.id      = prefix + "-node";
  node.address = "10.0.0.1";
  node.port    = 3000;
  node.api_key = "k";
  store.Put(node);
  store.MutateIndex([&](std::vector<std::string>& ids) {
    ids.push_back(node.id);
    return true;
  });

  assert(store.Get(node.id)->address == "10.0.0.1");
  const auto ids = store.ListIds();
  assert(!ids.empty() && ids.back() == node.id);

  store.MutateIndex([&](std::vector<std::string>& index) {
    index.pop_back();
    return true;
  });
  store.Remove(node.id);
  assert(!store.Get(node.id).has_value());
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart) {
    return;
  }

  {
    auto kv = backend.make_store();
    assert(kv->Set(prefix + "-durable", "persisted"));
  }

  auto reopened = backend.make_store();
  assert(reopened->Get(prefix + "-durable").value() == "persisted");
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_store       = []() { return std::make_shared<fleet::kv::memory::MemoryKeyValueStore>(); },
      .supports_restart = false,
      .cleanup          = []() {},
  };
}

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("fleet_registry_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  return BackendFactory{
      .name = "sqlite",
      .make_store =
          [db_path]() {
            auto db    = std::make_shared<fleet::kv::sqlite::SqliteDB>(db_path);
            auto store = std::make_shared<fleet::kv::sqlite::SqliteKeyValueStore>(std::move(db));
            store->Bootstrap();
            return store;
          },
      .supports_restart = true,
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
  };
}

#if FLEET_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("FLEET_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("FLEET_TEST_POSTGRES_URI is not set");
  }

  auto conninfo = std::string(uri);
  return BackendFactory{
      .name = "postgres",
      .make_store =
          [conninfo]() {
            auto pool  = std::make_shared<fleet::kv::postgres::PgPool>(conninfo);
            auto store = std::make_shared<fleet::kv::postgres::PgKeyValueStore>(std::move(pool));
            store->Bootstrap();
            return store;
          },
      .supports_restart = true,
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  const auto prefix = backend.name + "-" + std::to_string(NowMs());
  auto       kv     = backend.make_store();

  VerifyGetSetDelete(*kv, prefix);
  VerifyLargeAndUnicodeValues(*kv, prefix);
  VerifyConcurrentWritersOnDistinctKeys(*kv, prefix);
  VerifyRegistryOnBackend(kv, prefix);

  kv.reset();
  VerifyRestartDurability(backend, prefix);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeSqliteFactory());

#if FLEET_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "fleet_registry_integration_kv_store_parity: pass\n";
  return 0;
}
