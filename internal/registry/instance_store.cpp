#include "instance_store.hpp"

#include <google/protobuf/struct.pb.h>

#include <stdexcept>
#include <unordered_set>

#include "internal/registry/json_codec.hpp"

namespace fleet::registry {

namespace {

google::protobuf::ListValue LoadList(kv::KeyValueStore& kv, const std::string& key) {
  const auto json = kv.Get(key);
  if (!json || json->empty()) {
    return {};
  }

  auto value = codec::ParseJson(*json);
  if (value.kind_case() == google::protobuf::Value::kNullValue) {
    return {};
  }
  if (value.kind_case() != google::protobuf::Value::kListValue) {
    throw std::runtime_error("\"" + key + "\" is not a JSON array");
  }
  return value.list_value();
}

void StoreList(kv::KeyValueStore& kv, const std::string& key, const google::protobuf::ListValue& list) {
  google::protobuf::Value value;
  *value.mutable_list_value() = list;
  kv::ThrowIfKvError(kv.Set(key, codec::ToJson(value)), "write " + key);
}

} // namespace

InstanceStore::InstanceStore(std::shared_ptr<kv::KeyValueStore> kv) : kv_(std::move(kv)) {
}

std::vector<model::Instance> InstanceStore::List() {
  std::lock_guard lock(mutex_);
  const auto      list = LoadList(*kv_, kInstancesKey);

  std::vector<model::Instance> instances;
  instances.reserve(list.values_size());
  for (const auto& item : list.values()) {
    instances.push_back(codec::DecodeInstance(item));
  }
  return instances;
}

std::size_t InstanceStore::MarkSuspended(const std::unordered_map<std::string, std::string>& flagged_by_container) {
  if (flagged_by_container.empty()) {
    return 0;
  }

  std::lock_guard lock(mutex_);
  auto            list    = LoadList(*kv_, kInstancesKey);
  std::size_t     updated = 0;

  for (auto& item : *list.mutable_values()) {
    if (item.kind_case() != google::protobuf::Value::kStructValue) {
      continue;
    }
    const auto instance = codec::DecodeInstance(item);
    const auto it       = flagged_by_container.find(instance.container_id);
    if (instance.container_id.empty() || it == flagged_by_container.end()) {
      continue;
    }

    auto& fields = *item.mutable_struct_value()->mutable_fields();
    fields["suspended"].set_bool_value(true);
    fields["suspended-flagg"].set_string_value(it->second);
    ++updated;
  }

  if (updated > 0) {
    StoreList(*kv_, kInstancesKey, list);
  }
  return updated;
}

std::vector<model::Instance> InstanceStore::RemoveByNode(const std::string& node_id) {
  std::lock_guard lock(mutex_);
  const auto      list = LoadList(*kv_, kInstancesKey);

  google::protobuf::ListValue  kept;
  std::vector<model::Instance> removed;
  for (const auto& item : list.values()) {
    auto instance = codec::DecodeInstance(item);
    if (!node_id.empty() && instance.node_id == node_id) {
      removed.push_back(std::move(instance));
      continue;
    }
    *kept.add_values() = item;
  }

  if (removed.empty()) {
    return removed;
  }

  StoreList(*kv_, kInstancesKey, kept);

  std::unordered_set<std::string> removed_ids;
  std::unordered_set<std::string> owners;
  for (const auto& instance : removed) {
    removed_ids.insert(instance.id);
    if (!instance.id.empty()) {
      kv::ThrowIfKvError(kv_->Delete(instance.id + "_instance"), "delete instance " + instance.id);
    }
    if (!instance.user.empty()) {
      owners.insert(instance.user);
    }
  }

  for (const auto& user : owners) {
    const auto                  key       = user + "_instances";
    const auto                  user_list = LoadList(*kv_, key);
    google::protobuf::ListValue user_kept;
    for (const auto& item : user_list.values()) {
      if (removed_ids.count(codec::DecodeInstance(item).id) == 0) {
        *user_kept.add_values() = item;
      }
    }
    StoreList(*kv_, key, user_kept);
  }

  return removed;
}

} // namespace fleet::registry
