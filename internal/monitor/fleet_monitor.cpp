#include "fleet_monitor.hpp"

#include <optional>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace fleet::monitor {

using registry::model::NodeRecord;
using registry::model::NodeStatus;

FleetMonitor::FleetMonitor(std::shared_ptr<registry::NodeRecordStore> store,
                           std::shared_ptr<probe::HealthProber>       prober,
                           std::shared_ptr<probe::NodeDaemonClient>   client,
                           std::shared_ptr<ProbePool>                 pool,
                           std::chrono::milliseconds                  refresh_deadline)
    : store_(std::move(store)),
      prober_(std::move(prober)),
      client_(std::move(client)),
      pool_(std::move(pool)),
      refresh_deadline_(refresh_deadline) {
  if (!store_ || !prober_ || !client_ || !pool_) {
    throw std::invalid_argument("FleetMonitor: missing dependency");
  }
}

template <typename T>
void FleetMonitor::AwaitAll(std::vector<std::future<T>>& futures, const char* what) {
  if (refresh_deadline_.count() <= 0) {
    for (auto& future : futures) future.wait();
    return;
  }

  const auto deadline = std::chrono::steady_clock::now() + refresh_deadline_;
  for (auto& future : futures) {
    if (future.wait_until(deadline) != std::future_status::ready) {
      FLEET_LOG_WARN("fleet operation exceeded its deadline",
                     {observability::StringField("operation", what), observability::IntField("deadline_ms", refresh_deadline_.count())});
      throw util::DeadlineExceeded(std::string(what) + " did not finish within " + std::to_string(refresh_deadline_.count()) + "ms");
    }
  }
}

std::vector<NodeRecord> FleetMonitor::ProbeAll(const std::vector<NodeRecord>& records) {
  std::vector<std::future<NodeRecord>> futures;
  futures.reserve(records.size());

  for (const auto& record : records) {
    auto prober = prober_;
    futures.push_back(pool_->Submit([prober, record] { return prober->Probe(record); }));
  }

  AwaitAll(futures, "fleet refresh");

  // collect every result before surfacing the first storage failure
  std::vector<NodeRecord> results;
  results.reserve(futures.size());
  std::exception_ptr first_error;
  for (auto& future : futures) {
    try {
      results.push_back(future.get());
    } catch (const std::exception& e) {
      FLEET_LOG_ERROR("probe result could not be stored", {observability::StringField("error", e.what())});
      if (!first_error) first_error = std::current_exception();
    }
  }
  if (first_error) {
    std::rethrow_exception(first_error);
  }
  return results;
}

std::vector<NodeRecord> FleetMonitor::RefreshAll() {
  observability::SpanScope span("FleetMonitor.RefreshAll");

  std::vector<NodeRecord> records;
  for (const auto& id : store_->ListIds()) {
    auto record = store_->Get(id);
    if (!record) {
      FLEET_LOG_WARN("index entry without node record", {observability::StringField("node_id", id)});
      continue;
    }
    records.push_back(std::move(*record));
  }
  span.SetAttribute("fleet.nodes", static_cast<std::int64_t>(records.size()));

  auto results = ProbeAll(records);

  std::uint64_t online = 0;
  std::uint64_t offline = 0;
  for (const auto& node : results) {
    if (node.status == NodeStatus::Online) {
      ++online;
    } else if (node.status == NodeStatus::Offline) {
      ++offline;
    }
  }
  observability::Metrics::Instance().SetFleetNodeCount("online", online);
  observability::Metrics::Instance().SetFleetNodeCount("offline", offline);

  FLEET_LOG_INFO("fleet refreshed", {observability::IntField("nodes", static_cast<std::int64_t>(results.size())),
                                     observability::IntField("online", static_cast<std::int64_t>(online)),
                                     observability::IntField("offline", static_cast<std::int64_t>(offline))});
  return results;
}

std::vector<NodeRecord> FleetMonitor::Refresh(const std::vector<std::string>& ids) {
  observability::SpanScope span("FleetMonitor.Refresh");

  std::vector<NodeRecord> records;
  records.reserve(ids.size());
  for (const auto& id : ids) {
    auto record = store_->Get(id);
    if (!record) {
      throw util::NotFound("node not found: " + id);
    }
    records.push_back(std::move(*record));
  }
  return ProbeAll(records);
}

std::unordered_map<std::string, std::string> FleetMonitor::CollectFlaggedContainers(const std::vector<NodeRecord>& nodes) {
  observability::SpanScope span("FleetMonitor.CollectFlaggedContainers");

  using Flagged = std::optional<std::unordered_map<std::string, std::string>>;

  std::vector<std::future<Flagged>> futures;
  for (const auto& node : nodes) {
    if (node.status != NodeStatus::Online) continue;
    auto client = client_;
    futures.push_back(pool_->Submit([client, node] { return client->CheckFlagged(node); }));
  }

  AwaitAll(futures, "radar check");

  std::unordered_map<std::string, std::string> merged;
  for (auto& future : futures) {
    auto flagged = future.get();
    if (!flagged) continue;
    for (auto& [container_id, message] : *flagged) {
      merged[container_id] = std::move(message);
    }
  }
  span.SetAttribute("fleet.flagged", static_cast<std::int64_t>(merged.size()));
  return merged;
}

} // namespace fleet::monitor
