#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

#include "internal/probe/health_prober.hpp"
#include "internal/probe/node_daemon_client.hpp"
#include "internal/registry/instance_store.hpp"
#include "internal/registry/model/node_record.hpp"
#include "internal/registry/node_record_store.hpp"

namespace fleet::core {

/*
  Registry operations on node records.

  Ordering against the index:
    create: record written, then id appended
    delete: id removed, then record deleted
  so a reader of the index never sees an id whose record was not written.

  Create, Update and Configure end with one probe and return the probed
  record.
*/
class NodeRegistry {
 public:
  NodeRegistry(std::shared_ptr<registry::NodeRecordStore> store,
               std::shared_ptr<registry::InstanceStore>   instances,
               std::shared_ptr<probe::HealthProber>       prober,
               std::shared_ptr<probe::NodeDaemonClient>   client);

  registry::model::NodeRecord Create(const registry::model::NodeSpec& spec);
  registry::model::NodeRecord Update(const std::string& id, const registry::model::NodeSpec& spec);

  // Unknown ids are a no-op. A node that still owns instances is only
  // removed when delete_instances is set; its instances go with it.
  // Returns the number of instances removed.
  std::size_t Delete(const std::string& id, bool delete_instances);

  // Stored state, no probe.
  registry::model::NodeRecord Get(const std::string& id);

  // Rotates the node's configure key and returns the command an operator
  // runs on the node to register itself.
  std::string IssueConfigureCommand(const std::string& id, const std::string& panel_url);

  // Installs access_key as the api key of the node holding configure_key.
  // The configure key is consumed.
  registry::model::NodeRecord Configure(const std::string& configure_key, const std::string& access_key);

 private:
  static void ValidateSpec(const registry::model::NodeSpec& spec);

  std::shared_ptr<registry::NodeRecordStore> store_;
  std::shared_ptr<registry::InstanceStore>   instances_;
  std::shared_ptr<probe::HealthProber>       prober_;
  std::shared_ptr<probe::NodeDaemonClient>   client_;

  // configure keys are looked up and consumed under this lock
  std::mutex configure_mutex_;
};

} // namespace fleet::core
