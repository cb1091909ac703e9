#pragma once

#include <cstdint>
#include <memory>

#include "internal/probe/node_daemon_client.hpp"
#include "internal/registry/node_record_store.hpp"

namespace fleet::probe {

/*
  Health Prober

  One authenticated GET / per call. The outcome is classified, merged
  onto the stored record under its lock and returned:

    reply is a JSON object   -> Online, capability fields copied from the body
    anything else            -> Offline, capability fields untouched

  Only status, the capability fields and last_probed_at_ms are written.
  A record deleted, or given a new address, port or api key, while the
  request was in flight is left as is.

  Probe failures never throw. Only a failed write to the store does.
*/
class HealthProber {
 public:
  HealthProber(std::shared_ptr<NodeDaemonClient> client, std::shared_ptr<registry::NodeRecordStore> store);

  registry::model::NodeRecord Probe(const registry::model::NodeRecord& node);

 private:
  static void ApplyOutcome(const StatusReply& reply, uint64_t probed_at_ms, registry::model::NodeRecord& record);

  std::shared_ptr<NodeDaemonClient>          client_;
  std::shared_ptr<registry::NodeRecordStore> store_;
};

} // namespace fleet::probe
