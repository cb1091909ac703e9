#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/kv/api/kv_store.hpp"
#include "internal/registry/model/node_record.hpp"

namespace fleet::registry {

/*
  Node Record Store

  Layout inside the key-value store:

    "nodes"        -> ["<id>", ...]   ordered index of known nodes
    "<id>_node"    -> NodeRecord      one record per node

  The store serializes every read-modify-write of the index in process.
  Writes to one record (Put, Remove, Modify) are serialized by a lock
  stripe chosen from the node id, so a Modify never resurrects a record
  removed before it took the lock.
*/
class NodeRecordStore {
 public:
  static constexpr const char* kIndexKey = "nodes";

  explicit NodeRecordStore(std::shared_ptr<kv::KeyValueStore> kv);

  static std::string RecordKey(const std::string& id);

  std::vector<std::string> ListIds();

  std::optional<model::NodeRecord> Get(const std::string& id);

  // Upsert of the whole record.
  void Put(const model::NodeRecord& record);

  // Idempotent.
  void Remove(const std::string& id);

  // Read-modify-write of one record under its lock. fn edits the current
  // record and returns false to skip the write. Returns the record as it
  // stands afterwards, or nullopt when it does not exist (nothing is written).
  std::optional<model::NodeRecord> Modify(const std::string& id, const std::function<bool(model::NodeRecord&)>& fn);

  std::vector<std::string> ListIndex();
  void                     SetIndex(const std::vector<std::string>& ids);

  // Runs fn on the current index under the index lock and writes the
  // result back if fn returns true.
  void MutateIndex(const std::function<bool(std::vector<std::string>&)>& fn);

 private:
  static constexpr std::size_t kRecordLockStripes = 32;

  std::vector<std::string> ReadIndexUnlocked();
  std::mutex&              RecordMutex(const std::string& id);
  void                     PutUnlocked(const model::NodeRecord& record);

  std::shared_ptr<kv::KeyValueStore>         kv_;
  std::mutex                                 index_mutex_;
  std::array<std::mutex, kRecordLockStripes> record_mutexes_;
};

} // namespace fleet::registry
