#include "sqlite_kv_store.hpp"

#include <stdexcept>

namespace fleet::kv::sqlite {

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

SqliteKeyValueStore::SqliteKeyValueStore(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

void SqliteKeyValueStore::Bootstrap() {
  db_->Exec("CREATE TABLE IF NOT EXISTS kv (key TEXT PRIMARY KEY, value TEXT NOT NULL);");
  db_->Exec("SELECT key,value FROM kv LIMIT 1;");
}

Result SqliteKeyValueStore::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

std::optional<std::string> SqliteKeyValueStore::Get(const std::string& key) {
  sqlite3_stmt* st = db_->Prepare("SELECT value FROM kv WHERE key=?;");
  BindText(st, 1, key);

  const int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) {
    auto value = ColText(st, 0);
    sqlite3_finalize(st);
    return value;
  }

  sqlite3_finalize(st);
  if (rc == SQLITE_DONE) {
    return std::nullopt;
  }
  throw std::runtime_error("sqlite get " + key + ": " + sqlite3_errmsg(db_->Handle()));
}

Result SqliteKeyValueStore::Set(const std::string& key, const std::string& value) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db_->Handle(), "INSERT INTO kv(key,value) VALUES(?,?) ON CONFLICT(key) DO UPDATE SET value=excluded.value;", -1, &st,
                         nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db_->Handle()));
  }

  BindText(st, 1, key);
  BindText(st, 2, value);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  return Translate(db_->Handle(), rc);
}

Result SqliteKeyValueStore::Delete(const std::string& key) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db_->Handle(), "DELETE FROM kv WHERE key=?;", -1, &st, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db_->Handle()));
  }

  BindText(st, 1, key);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  return Translate(db_->Handle(), rc);
}

} // namespace fleet::kv::sqlite
