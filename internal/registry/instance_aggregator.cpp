#include "instance_aggregator.hpp"

namespace fleet::registry {

InstanceCountSnapshot CountInstancesPerNode(const std::vector<std::string>& node_ids, const std::vector<model::Instance>& instances) {
  InstanceCountSnapshot counts;
  counts.reserve(node_ids.size());
  for (const auto& id : node_ids) {
    counts.emplace(id, 0);
  }

  for (const auto& instance : instances) {
    auto it = counts.find(instance.node_id);
    if (it != counts.end()) {
      ++it->second;
    }
  }
  return counts;
}

} // namespace fleet::registry
