#include "node_record_store.hpp"

#include "internal/registry/json_codec.hpp"

namespace fleet::registry {

NodeRecordStore::NodeRecordStore(std::shared_ptr<kv::KeyValueStore> kv) : kv_(std::move(kv)) {
}

std::string NodeRecordStore::RecordKey(const std::string& id) {
  return id + "_node";
}

std::vector<std::string> NodeRecordStore::ListIds() {
  return ListIndex();
}

std::optional<model::NodeRecord> NodeRecordStore::Get(const std::string& id) {
  const auto json = kv_->Get(RecordKey(id));
  if (!json || json->empty() || *json == "null") {
    return std::nullopt;
  }
  return codec::DecodeNode(*json);
}

void NodeRecordStore::Put(const model::NodeRecord& record) {
  std::lock_guard lock(RecordMutex(record.id));
  PutUnlocked(record);
}

void NodeRecordStore::Remove(const std::string& id) {
  std::lock_guard lock(RecordMutex(id));
  kv::ThrowIfKvError(kv_->Delete(RecordKey(id)), "delete node " + id);
}

std::optional<model::NodeRecord> NodeRecordStore::Modify(const std::string& id, const std::function<bool(model::NodeRecord&)>& fn) {
  std::lock_guard lock(RecordMutex(id));
  auto            record = Get(id);
  if (!record) {
    return std::nullopt;
  }

  auto edited = *record;
  if (!fn(edited)) {
    return record;
  }
  edited.id = id;
  PutUnlocked(edited);
  return edited;
}

std::mutex& NodeRecordStore::RecordMutex(const std::string& id) {
  return record_mutexes_[std::hash<std::string>{}(id) % kRecordLockStripes];
}

void NodeRecordStore::PutUnlocked(const model::NodeRecord& record) {
  kv::ThrowIfKvError(kv_->Set(RecordKey(record.id), codec::EncodeNode(record)), "write node " + record.id);
}

std::vector<std::string> NodeRecordStore::ReadIndexUnlocked() {
  const auto json = kv_->Get(kIndexKey);
  if (!json || json->empty()) {
    return {};
  }
  return codec::DecodeIds(*json);
}

std::vector<std::string> NodeRecordStore::ListIndex() {
  std::lock_guard lock(index_mutex_);
  return ReadIndexUnlocked();
}

void NodeRecordStore::SetIndex(const std::vector<std::string>& ids) {
  std::lock_guard lock(index_mutex_);
  kv::ThrowIfKvError(kv_->Set(kIndexKey, codec::EncodeIds(ids)), "write node index");
}

void NodeRecordStore::MutateIndex(const std::function<bool(std::vector<std::string>&)>& fn) {
  std::lock_guard lock(index_mutex_);
  auto            ids = ReadIndexUnlocked();
  if (!fn(ids)) {
    return;
  }
  kv::ThrowIfKvError(kv_->Set(kIndexKey, codec::EncodeIds(ids)), "write node index");
}

} // namespace fleet::registry
