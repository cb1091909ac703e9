#pragma once

#include <mutex>
#include <unordered_map>

#include "internal/kv/api/kv_store.hpp"

namespace fleet::kv::memory {

class MemoryKeyValueStore final : public KeyValueStore {
 public:
  MemoryKeyValueStore();

  std::optional<std::string> Get(const std::string& key) override;
  Result                     Set(const std::string& key, const std::string& value) override;
  Result                     Delete(const std::string& key) override;

 private:
  std::mutex                                   mutex_;
  std::unordered_map<std::string, std::string> entries_;
};

} // namespace fleet::kv::memory
