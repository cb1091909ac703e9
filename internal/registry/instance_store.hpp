#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/kv/api/kv_store.hpp"
#include "internal/registry/model/instance.hpp"

namespace fleet::registry {

/*
  Access to the instance list owned by the instance subsystem.

    "instances"            -> [ {Id, Node:{id,...}, ContainerId, User, ...}, ... ]
    "<Id>_instance"        -> single instance
    "<User>_instances"     -> per-user list

  Rewrites keep every field of an entry, including the ones this service
  does not interpret.
*/
class InstanceStore {
 public:
  static constexpr const char* kInstancesKey = "instances";

  explicit InstanceStore(std::shared_ptr<kv::KeyValueStore> kv);

  std::vector<model::Instance> List();

  // Marks every instance running one of the given containers as suspended,
  // with the flag message as reason. Returns the number of instances updated.
  std::size_t MarkSuspended(const std::unordered_map<std::string, std::string>& flagged_by_container);

  // Removes all instances owned by node_id, together with their per-instance
  // keys and per-user list entries. Returns the removed instances.
  std::vector<model::Instance> RemoveByNode(const std::string& node_id);

 private:
  std::shared_ptr<kv::KeyValueStore> kv_;
  std::mutex                         mutex_;
};

} // namespace fleet::registry
