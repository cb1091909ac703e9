#pragma once

#include <sqlite3.h>

#include <string>

namespace fleet::kv::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  Opened with SQLITE_OPEN_FULLMUTEX so one handle can be shared by the
  gRPC worker threads and the probe pool.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

 private:
  void Configure(bool wal_mode);

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace fleet::kv::sqlite
