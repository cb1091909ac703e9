#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/registry/model/instance.hpp"

namespace fleet::registry {

using InstanceCountSnapshot = std::unordered_map<std::string, uint64_t>;

// Every node in node_ids gets an entry, zero when it owns nothing.
// Instances pointing at nodes outside node_ids are ignored.
InstanceCountSnapshot CountInstancesPerNode(const std::vector<std::string>& node_ids, const std::vector<model::Instance>& instances);

} // namespace fleet::registry
