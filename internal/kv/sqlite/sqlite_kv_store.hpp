#pragma once

#include <memory>

#include "internal/kv/api/kv_store.hpp"
#include "sqlite_db.hpp"

namespace fleet::kv::sqlite {

/*
  Key-value table on SQLite:

    kv(key TEXT PRIMARY KEY, value TEXT NOT NULL)

  Bootstrap() creates the table; it is idempotent.
*/
class SqliteKeyValueStore final : public KeyValueStore {
 public:
  explicit SqliteKeyValueStore(std::shared_ptr<SqliteDB> db);

  void Bootstrap();

  std::optional<std::string> Get(const std::string& key) override;
  Result                     Set(const std::string& key, const std::string& value) override;
  Result                     Delete(const std::string& key) override;

 private:
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace fleet::kv::sqlite
