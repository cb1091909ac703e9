#include "health_prober.hpp"

#include <chrono>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/time.hpp"

namespace fleet::probe {

using registry::model::NodeRecord;
using registry::model::NodeStatus;

HealthProber::HealthProber(std::shared_ptr<NodeDaemonClient> client, std::shared_ptr<registry::NodeRecordStore> store)
    : client_(std::move(client)), store_(std::move(store)) {
  if (!client_ || !store_) {
    throw std::invalid_argument("HealthProber requires a client and a store");
  }
}

NodeRecord HealthProber::Probe(const NodeRecord& node) {
  observability::SpanScope span("HealthProber.Probe");
  span.SetAttribute("node.id", node.id);

  const auto started_at = std::chrono::steady_clock::now();
  const auto reply      = client_->FetchStatus(node);
  const auto elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();

  const auto probed_at_ms = util::ToUnixMillis(util::Now());

  if (reply.reachable) {
    FLEET_LOG_DEBUG("node probe succeeded", {observability::StringField("node_id", node.id), observability::DurationMsField("duration_ms", elapsed_ms)});
  } else {
    span.AddEvent("probe.failed");

    FLEET_LOG_WARN("node probe failed", {observability::StringField("node_id", node.id), observability::StringField("address", node.address),
                                         observability::StringField("reason", reply.error),
                                         observability::DurationMsField("duration_ms", elapsed_ms)});
  }

  observability::Metrics::Instance().ObserveProbeDurationMs(reply.reachable ? "online" : "offline", elapsed_ms);

  // The outcome is merged onto the record as it is now. It is dropped when
  // the node was deleted or re-targeted while the request was in flight.
  bool applied = false;
  auto stored  = store_->Modify(node.id, [&](NodeRecord& current) {
    if (current.address != node.address || current.port != node.port || current.api_key != node.api_key) {
      return false;
    }
    ApplyOutcome(reply, probed_at_ms, current);
    applied = true;
    return true;
  });

  if (!stored) {
    FLEET_LOG_DEBUG("probe result dropped, node removed", {observability::StringField("node_id", node.id)});
    auto detached = node;
    ApplyOutcome(reply, probed_at_ms, detached);
    return detached;
  }
  if (!applied) {
    FLEET_LOG_DEBUG("probe result dropped, node changed", {observability::StringField("node_id", node.id)});
  }
  return *stored;
}

void HealthProber::ApplyOutcome(const StatusReply& reply, uint64_t probed_at_ms, NodeRecord& record) {
  record.last_probed_at_ms = probed_at_ms;
  if (!reply.reachable) {
    record.status = NodeStatus::Offline;
    return;
  }

  const auto& status = reply.status;
  if (status.version_family) record.version_family = *status.version_family;
  if (status.version_release) record.version_release = *status.version_release;
  if (status.remote) record.remote = *status.remote;
  if (status.docker) record.docker = *status.docker;
  record.status = NodeStatus::Online;
}

} // namespace fleet::probe
