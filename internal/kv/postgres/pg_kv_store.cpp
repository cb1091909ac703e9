#include "pg_kv_store.hpp"

namespace fleet::kv::postgres {

PgKeyValueStore::PgKeyValueStore(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

void PgKeyValueStore::Bootstrap() {
  auto       conn = pool_->Acquire();
  pqxx::work tx(*conn);
  tx.exec("CREATE TABLE IF NOT EXISTS kv (key VARCHAR(255) PRIMARY KEY, value TEXT NOT NULL);");
  tx.exec("SELECT key,value FROM kv LIMIT 1;");
  tx.commit();
}

Result PgKeyValueStore::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

std::optional<std::string> PgKeyValueStore::Get(const std::string& key) {
  auto       conn = pool_->Acquire();
  pqxx::work tx(*conn);
  auto       res = tx.exec_prepared("kv_get", key);
  tx.commit();

  if (res.empty()) return std::nullopt;
  return std::string(res[0][0].c_str());
}

Result PgKeyValueStore::Set(const std::string& key, const std::string& value) {
  try {
    auto       conn = pool_->Acquire();
    pqxx::work tx(*conn);
    tx.exec_prepared("kv_set", key, value);
    tx.commit();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgKeyValueStore::Delete(const std::string& key) {
  try {
    auto       conn = pool_->Acquire();
    pqxx::work tx(*conn);
    tx.exec_prepared("kv_delete", key);
    tx.commit();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace fleet::kv::postgres
