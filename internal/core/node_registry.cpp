#include "node_registry.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace fleet::core {

using registry::model::NodeRecord;
using registry::model::NodeSpec;
using registry::model::NodeStatus;

namespace {

NodeRecord FromSpec(const std::string& id, const NodeSpec& spec) {
  NodeRecord record;
  record.id        = id;
  record.name      = spec.name;
  record.tags      = spec.tags;
  record.ram       = spec.ram;
  record.disk      = spec.disk;
  record.processor = spec.processor;
  record.address   = spec.address;
  record.port      = spec.port;
  record.api_key   = spec.api_key;
  record.status    = NodeStatus::Unknown;
  return record;
}

void RemoveFromIndex(registry::NodeRecordStore& store, const std::string& id) {
  store.MutateIndex([&](std::vector<std::string>& ids) {
    const auto before = ids.size();
    ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
    return ids.size() != before;
  });
}

} // namespace

NodeRegistry::NodeRegistry(std::shared_ptr<registry::NodeRecordStore> store,
                           std::shared_ptr<registry::InstanceStore>   instances,
                           std::shared_ptr<probe::HealthProber>       prober,
                           std::shared_ptr<probe::NodeDaemonClient>   client)
    : store_(std::move(store)), instances_(std::move(instances)), prober_(std::move(prober)), client_(std::move(client)) {
  if (!store_ || !instances_ || !prober_ || !client_) {
    throw std::invalid_argument("NodeRegistry: missing dependency");
  }
}

void NodeRegistry::ValidateSpec(const NodeSpec& spec) {
  std::vector<std::string> missing;
  if (spec.address.empty()) missing.push_back("address");
  if (spec.port == 0) missing.push_back("port");
  if (spec.api_key.empty()) missing.push_back("apiKey");

  if (missing.empty()) {
    return;
  }

  std::string message = "missing required fields:";
  for (const auto& field : missing) {
    message += " " + field;
  }
  throw util::ValidationError(message);
}

NodeRecord NodeRegistry::Create(const NodeSpec& spec) {
  ValidateSpec(spec);

  auto record          = FromSpec(util::NewUuidString(), spec);
  record.configure_key = util::NewUuidString();

  store_->Put(record);
  store_->MutateIndex([&](std::vector<std::string>& ids) {
    if (std::find(ids.begin(), ids.end(), record.id) != ids.end()) {
      return false;
    }
    ids.push_back(record.id);
    return true;
  });

  FLEET_LOG_INFO("node created", {observability::StringField("node_id", record.id), observability::StringField("address", record.address)});
  return prober_->Probe(record);
}

NodeRecord NodeRegistry::Update(const std::string& id, const NodeSpec& spec) {
  if (!store_->Get(id)) {
    throw util::NotFound("node not found: " + id);
  }
  ValidateSpec(spec);

  const auto record = store_->Modify(id, [&](NodeRecord& current) {
    current = FromSpec(id, spec);
    return true;
  });
  if (!record) {
    throw util::NotFound("node not found: " + id);
  }

  FLEET_LOG_INFO("node updated", {observability::StringField("node_id", id)});
  return prober_->Probe(*record);
}

std::size_t NodeRegistry::Delete(const std::string& id, bool delete_instances) {
  if (id.empty()) {
    throw util::InvalidArgument("node id is required");
  }

  const auto record = store_->Get(id);
  if (!record) {
    // unknown ids are a no-op; a dangling index entry is dropped
    RemoveFromIndex(*store_, id);
    return 0;
  }

  std::size_t owned = 0;
  for (const auto& instance : instances_->List()) {
    if (instance.node_id == id) ++owned;
  }

  std::size_t removed = 0;
  if (owned > 0) {
    if (!delete_instances) {
      throw util::FailedPrecondition("node " + id + " still has " + std::to_string(owned) + " instance(s); set delete_instances to remove them");
    }

    removed = instances_->RemoveByNode(id).size();

    // the daemon may be gone already; its containers are orphaned then
    client_->PurgeInstances(*record);
  }

  RemoveFromIndex(*store_, id);
  store_->Remove(id);

  FLEET_LOG_INFO("node deleted", {observability::StringField("node_id", id), observability::IntField("instances_removed", static_cast<std::int64_t>(removed))});
  return removed;
}

NodeRecord NodeRegistry::Get(const std::string& id) {
  auto record = store_->Get(id);
  if (!record) {
    throw util::NotFound("node not found: " + id);
  }
  return *record;
}

std::string NodeRegistry::IssueConfigureCommand(const std::string& id, const std::string& panel_url) {
  if (panel_url.empty()) {
    throw util::InvalidArgument("panel url is required");
  }

  std::lock_guard lock(configure_mutex_);

  const auto key    = util::NewUuidString();
  const auto record = store_->Modify(id, [&](NodeRecord& current) {
    current.configure_key = key;
    return true;
  });
  if (!record) {
    throw util::NotFound("node not found: " + id);
  }

  return "npm run configure -- --panel " + panel_url + " --key " + key;
}

NodeRecord NodeRegistry::Configure(const std::string& configure_key, const std::string& access_key) {
  if (configure_key.empty() || access_key.empty()) {
    throw util::InvalidArgument("configure key and access key are required");
  }

  NodeRecord record;
  {
    std::lock_guard lock(configure_mutex_);

    std::optional<NodeRecord> configured;
    for (const auto& id : store_->ListIds()) {
      bool redeemed = false;
      auto current  = store_->Modify(id, [&](NodeRecord& candidate) {
        if (candidate.configure_key != configure_key) {
          return false;
        }
        candidate.api_key = access_key;
        candidate.configure_key.clear();
        candidate.status = NodeStatus::Unknown;
        redeemed         = true;
        return true;
      });
      if (redeemed) {
        configured = std::move(current);
        break;
      }
    }
    if (!configured) {
      throw util::NotFound("no node holds this configure key");
    }
    record = std::move(*configured);
  }

  FLEET_LOG_INFO("node configured", {observability::StringField("node_id", record.id)});
  return prober_->Probe(record);
}

} // namespace fleet::core
