#pragma once

#include <memory>

#include "internal/kv/api/kv_store.hpp"
#include "pg_pool.hpp"

namespace fleet::kv::postgres {

class PgKeyValueStore final : public KeyValueStore {
 public:
  explicit PgKeyValueStore(std::shared_ptr<PgPool> pool);

  // Creates the kv table if missing.
  void Bootstrap();

  std::optional<std::string> Get(const std::string& key) override;
  Result                     Set(const std::string& key, const std::string& value) override;
  Result                     Delete(const std::string& key) override;

 private:
  static Result Translate(const std::exception& e);

  std::shared_ptr<PgPool> pool_;
};

} // namespace fleet::kv::postgres
