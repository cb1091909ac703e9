#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/monitor/probe_pool.hpp"
#include "internal/probe/health_prober.hpp"
#include "internal/probe/node_daemon_client.hpp"
#include "internal/registry/node_record_store.hpp"

namespace fleet::monitor {

/*
  Fleet Health Monitor

  Fans the prober out over the pool and waits for every probe (barrier).
  Results come back in index (or request) order, each bound to its own id.

  A refresh bounded by refresh_deadline fails with DeadlineExceeded when
  probes are still running at expiry. Those probes finish and persist in
  the background.
*/
class FleetMonitor {
 public:
  FleetMonitor(std::shared_ptr<registry::NodeRecordStore> store,
               std::shared_ptr<probe::HealthProber>       prober,
               std::shared_ptr<probe::NodeDaemonClient>   client,
               std::shared_ptr<ProbePool>                 pool,
               std::chrono::milliseconds                  refresh_deadline = std::chrono::milliseconds::zero());

  // Probes every indexed node. Index entries without a record are skipped.
  std::vector<registry::model::NodeRecord> RefreshAll();

  // Probes the given nodes. Throws NotFound if one of them is not registered.
  std::vector<registry::model::NodeRecord> Refresh(const std::vector<std::string>& ids);

  // Asks every online node for the containers it flagged, merged into
  // containerId -> message. Nodes that fail to answer are skipped.
  std::unordered_map<std::string, std::string> CollectFlaggedContainers(const std::vector<registry::model::NodeRecord>& nodes);

 private:
  std::vector<registry::model::NodeRecord> ProbeAll(const std::vector<registry::model::NodeRecord>& records);

  template <typename T>
  void AwaitAll(std::vector<std::future<T>>& futures, const char* what);

  std::shared_ptr<registry::NodeRecordStore> store_;
  std::shared_ptr<probe::HealthProber>       prober_;
  std::shared_ptr<probe::NodeDaemonClient>   client_;
  std::shared_ptr<ProbePool>                 pool_;
  std::chrono::milliseconds                  refresh_deadline_;
};

} // namespace fleet::monitor
