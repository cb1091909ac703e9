#include "memory_kv_store.hpp"

namespace fleet::kv::memory {

MemoryKeyValueStore::MemoryKeyValueStore() = default;

std::optional<std::string> MemoryKeyValueStore::Get(const std::string& key) {
  std::scoped_lock lock(mutex_);
  auto             it = entries_.find(key);
  if (it == entries_.end()) return std::nullopt;
  return it->second;
}

Result MemoryKeyValueStore::Set(const std::string& key, const std::string& value) {
  std::scoped_lock lock(mutex_);
  entries_[key] = value;
  return Result::Ok();
}

Result MemoryKeyValueStore::Delete(const std::string& key) {
  std::scoped_lock lock(mutex_);
  entries_.erase(key);
  return Result::Ok();
}

} // namespace fleet::kv::memory
