#include "node_admin_service.hpp"

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <type_traits>
#include <vector>

#include "internal/audit/audit_log.hpp"
#include "internal/core/node_registry.hpp"
#include "internal/monitor/fleet_monitor.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/probe/health_prober.hpp"
#include "internal/probe/node_daemon_client.hpp"
#include "internal/registry/instance_aggregator.hpp"
#include "internal/registry/instance_store.hpp"
#include "internal/registry/json_codec.hpp"
#include "internal/registry/node_record_store.hpp"
#include "internal/util/errors.hpp"

namespace fleet::service {

using namespace fleet::registry::v1;

namespace {

// uptime a daemon reports before it has collected any stats
constexpr const char* kZeroUptime = "0d 0h 0m";

NodeStatus ToProto(fleet::registry::model::NodeStatus status) {
  switch (status) {
    case fleet::registry::model::NodeStatus::Online:
      return NODE_STATUS_ONLINE;
    case fleet::registry::model::NodeStatus::Offline:
      return NODE_STATUS_OFFLINE;
    case fleet::registry::model::NodeStatus::Unknown:
      return NODE_STATUS_UNKNOWN;
  }
  return NODE_STATUS_UNKNOWN;
}

Node ToProto(const fleet::registry::model::NodeRecord& record) {
  Node node;
  node.set_id(record.id);
  node.set_name(record.name);
  node.set_tags(record.tags);
  node.set_ram(record.ram);
  node.set_disk(record.disk);
  node.set_processor(record.processor);
  node.set_address(record.address);
  node.set_port(record.port);
  node.set_api_key(record.api_key);
  node.set_status(ToProto(record.status));
  node.set_version_family(record.version_family);
  node.set_version_release(record.version_release);
  node.set_remote(record.remote);
  node.set_docker(record.docker);
  node.set_last_probed_at_ms(record.last_probed_at_ms);
  node.set_configure_key(record.configure_key);
  return node;
}

fleet::registry::model::NodeSpec FromProto(const NodeSpec& spec) {
  fleet::registry::model::NodeSpec out;
  out.name      = spec.name();
  out.tags      = spec.tags();
  out.ram       = spec.ram();
  out.disk      = spec.disk();
  out.processor = spec.processor();
  out.address   = spec.address();
  out.port      = spec.port();
  out.api_key   = spec.api_key();
  return out;
}

template <typename Fn>
auto ObserveRpc(std::string_view route, const std::string& node_id, Fn&& fn) {
  fleet::observability::SpanScope span(route);
  if (!node_id.empty()) {
    span.SetAttribute("node.id", node_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] { return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count(); };
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      fleet::observability::Metrics::Instance().RecordRequest(route, true);
      fleet::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return;
    } else {
      auto result = fn();
      fleet::observability::Metrics::Instance().RecordRequest(route, true);
      fleet::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    FLEET_LOG_ERROR("RPC failed", {fleet::observability::StringField("route", route), fleet::observability::StringField("error", ex.what()),
                                   fleet::observability::StringField("node_id", node_id)});
    fleet::observability::Metrics::Instance().RecordRequest(route, false);
    fleet::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

} // namespace

NodeAdminService::NodeAdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.registry || !ctx_.monitor || !ctx_.nodes || !ctx_.instances || !ctx_.prober || !ctx_.daemon) {
    throw std::invalid_argument("NodeAdminService: incomplete service context");
  }
}

void NodeAdminService::Audit(const AuditActor& actor, const std::string& action) {
  if (!ctx_.audit) {
    return;
  }
  fleet::registry::model::AuditEntry entry;
  entry.user_id  = actor.user_id;
  entry.username = actor.username;
  entry.action   = action;
  entry.ip       = actor.ip;
  ctx_.audit->Record(std::move(entry));
}

NodeResponse NodeAdminService::CreateNode(const CreateNodeRequest& req, const AuditActor& actor) {
  return ObserveRpc("NodeAdminService.CreateNode", "", [&] {
    NodeResponse resp;
    *resp.mutable_node() = ToProto(ctx_.registry->Create(FromProto(req.spec())));
    Audit(actor, "node:create");
    return resp;
  });
}

NodeResponse NodeAdminService::UpdateNode(const UpdateNodeRequest& req, const AuditActor& actor) {
  return ObserveRpc("NodeAdminService.UpdateNode", req.id(), [&] {
    NodeResponse resp;
    *resp.mutable_node() = ToProto(ctx_.registry->Update(req.id(), FromProto(req.spec())));
    Audit(actor, "node:update");
    return resp;
  });
}

void NodeAdminService::DeleteNode(const DeleteNodeRequest& req, const AuditActor& actor) {
  ObserveRpc("NodeAdminService.DeleteNode", req.id(), [&] {
    ctx_.registry->Delete(req.id(), req.delete_instances());
    Audit(actor, "node:delete");
  });
}

ListNodesResponse NodeAdminService::ListNodes(const ListNodesRequest& req) {
  return ObserveRpc("NodeAdminService.ListNodes", "", [&] {
    std::vector<std::string> ids(req.ids().begin(), req.ids().end());
    const auto               nodes = ids.empty() ? ctx_.monitor->RefreshAll() : ctx_.monitor->Refresh(ids);

    std::vector<std::string> node_ids;
    node_ids.reserve(nodes.size());
    ListNodesResponse resp;
    for (const auto& node : nodes) {
      node_ids.push_back(node.id);
      *resp.add_nodes() = ToProto(node);
    }

    const auto counts = fleet::registry::CountInstancesPerNode(node_ids, ctx_.instances->List());
    for (const auto& id : node_ids) {
      auto* count = resp.add_instance_counts();
      count->set_node_id(id);
      count->set_count(counts.at(id));
    }
    return resp;
  });
}

NodeResponse NodeAdminService::GetNode(const GetNodeRequest& req) {
  return ObserveRpc("NodeAdminService.GetNode", req.id(), [&] {
    NodeResponse resp;
    *resp.mutable_node() = ToProto(ctx_.registry->Get(req.id()));
    return resp;
  });
}

GetNodeStatsResponse NodeAdminService::GetNodeStats(const GetNodeStatsRequest& req) {
  return ObserveRpc("NodeAdminService.GetNodeStats", req.id(), [&] {
    const auto node = ctx_.prober->Probe(ctx_.registry->Get(req.id()));

    GetNodeStatsResponse resp;
    *resp.mutable_node() = ToProto(node);

    if (node.status == fleet::registry::model::NodeStatus::Online) {
      if (auto stats = ctx_.daemon->FetchStats(node)) {
        const auto uptime = fleet::registry::codec::StringField(*stats, "uptime");
        resp.mutable_stats()->set_reachable(uptime != kZeroUptime);
        *resp.mutable_stats()->mutable_stats() = std::move(*stats);
      }
    }

    const auto counts = fleet::registry::CountInstancesPerNode({node.id}, ctx_.instances->List());
    resp.set_instance_count(counts.at(node.id));
    return resp;
  });
}

RadarCheckResponse NodeAdminService::RadarCheck(const RadarCheckRequest&) {
  return ObserveRpc("NodeAdminService.RadarCheck", "", [&] {
    const auto nodes   = ctx_.monitor->RefreshAll();
    const auto flagged = ctx_.monitor->CollectFlaggedContainers(nodes);

    uint32_t online = 0;
    for (const auto& node : nodes) {
      if (node.status == fleet::registry::model::NodeStatus::Online) ++online;
    }

    const auto suspended = flagged.empty() ? 0 : ctx_.instances->MarkSuspended(flagged);
    if (suspended > 0) {
      FLEET_LOG_WARN("instances suspended by radar check", {fleet::observability::IntField("instances", static_cast<std::int64_t>(suspended))});
    }

    RadarCheckResponse resp;
    resp.set_nodes_checked(online);
    resp.set_flagged_containers(static_cast<uint32_t>(flagged.size()));
    resp.set_instances_suspended(static_cast<uint32_t>(suspended));
    return resp;
  });
}

IssueConfigureCommandResponse NodeAdminService::IssueConfigureCommand(const IssueConfigureCommandRequest& req, const AuditActor& actor) {
  return ObserveRpc("NodeAdminService.IssueConfigureCommand", req.id(), [&] {
    IssueConfigureCommandResponse resp;
    resp.set_node_id(req.id());
    resp.set_configure_command(ctx_.registry->IssueConfigureCommand(req.id(), req.panel_url()));
    Audit(actor, "node:configure-command");
    return resp;
  });
}

void NodeAdminService::ConfigureNode(const ConfigureNodeRequest& req, const AuditActor& actor) {
  ObserveRpc("NodeAdminService.ConfigureNode", "", [&] {
    ctx_.registry->Configure(req.configure_key(), req.access_key());
    Audit(actor, "node:configure");
  });
}

StatsResponse NodeAdminService::Stats(const StatsRequest&) {
  return ObserveRpc("NodeAdminService.Stats", "", [&] {
    StatsResponse resp;
    uint64_t      online  = 0;
    uint64_t      offline = 0;
    uint64_t      unknown = 0;
    for (const auto& id : ctx_.nodes->ListIds()) {
      const auto node = ctx_.nodes->Get(id);
      if (!node) continue;
      switch (node->status) {
        case fleet::registry::model::NodeStatus::Online:
          ++online;
          break;
        case fleet::registry::model::NodeStatus::Offline:
          ++offline;
          break;
        case fleet::registry::model::NodeStatus::Unknown:
          ++unknown;
          break;
      }
    }

    resp.set_nodes_total(online + offline + unknown);
    resp.set_nodes_online(online);
    resp.set_nodes_offline(offline);
    resp.set_nodes_unknown(unknown);
    resp.set_instances_total(ctx_.instances->List().size());
    return resp;
  });
}

}
