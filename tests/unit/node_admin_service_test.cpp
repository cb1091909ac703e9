#include "internal/service/node_admin_service.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "fleet/registry/v1.hpp"
#include "internal/audit/audit_log.hpp"
#include "internal/service/service_context.hpp"
#include "tests/support/registry_harness.hpp"

namespace {

using namespace fleet::registry::v1;
using fleet::service::AuditActor;
using fleet::testing::RegistryHarness;

struct ServiceHarness {
  ServiceHarness() {
    audit = std::make_shared<fleet::audit::AuditLog>(stack.kv, std::chrono::hours(24 * 30));

    fleet::service::ServiceContext ctx;
    ctx.registry  = stack.node_registry;
    ctx.monitor   = stack.fleet_monitor;
    ctx.nodes     = stack.nodes;
    ctx.instances = stack.instances;
    ctx.prober    = stack.prober;
    ctx.daemon    = stack.daemon;
    ctx.audit     = audit;
    service       = std::make_shared<fleet::service::NodeAdminService>(ctx);
  }

  std::string Create(const std::string& address, uint32_t port) {
    CreateNodeRequest req;
    req.mutable_spec()->set_name(address);
    req.mutable_spec()->set_address(address);
    req.mutable_spec()->set_port(port);
    req.mutable_spec()->set_api_key("k");
    return service->CreateNode(req, actor).node().id();
  }

  RegistryHarness                                   stack;
  std::shared_ptr<fleet::audit::AuditLog>           audit;
  std::shared_ptr<fleet::service::NodeAdminService> service;
  AuditActor                                        actor{"u-1", "root", "ipv4:10.10.0.5:40000"};
};

void TestListNodesRefreshesAndCountsInstances() {
  ServiceHarness h;
  h.stack.Healthy("10.0.0.1", 3001);
  h.stack.Healthy("10.0.0.2", 3002);
  const auto a = h.Create("10.0.0.1", 3001);
  const auto b = h.Create("10.0.0.2", 3002);
  const auto c = h.Create("10.0.0.3", 3003);
  h.stack.kv->Set("instances", R"([{"Node":{"id":")" + a + R"("}},{"Node":{"id":")" + a + R"("}},{"node":")" + b + R"("}])");

  // c comes back online between create and list
  h.stack.Healthy("10.0.0.3", 3003);

  const auto resp = h.service->ListNodes(ListNodesRequest{});
  assert(resp.nodes_size() == 3);
  assert(resp.nodes(0).id() == a);
  assert(resp.nodes(2).id() == c);
  assert(resp.nodes(2).status() == NODE_STATUS_ONLINE);

  assert(resp.instance_counts_size() == 3);
  assert(resp.instance_counts(0).node_id() == a && resp.instance_counts(0).count() == 2);
  assert(resp.instance_counts(1).node_id() == b && resp.instance_counts(1).count() == 1);
  assert(resp.instance_counts(2).node_id() == c && resp.instance_counts(2).count() == 0);

  ListNodesRequest subset;
  subset.add_ids(b);
  const auto one = h.service->ListNodes(subset);
  assert(one.nodes_size() == 1 && one.nodes(0).id() == b);
}

void TestStatsCountsStoredStatusWithoutProbing() {
  ServiceHarness h;
  h.stack.Healthy("10.0.0.1", 3001);
  h.Create("10.0.0.1", 3001);
  h.Create("10.0.0.2", 3002);
  h.stack.kv->Set("instances", R"([{"Id":"i1"},{"Id":"i2"}])");

  const auto calls = h.stack.http->requests().size();
  const auto resp  = h.service->Stats(StatsRequest{});
  assert(resp.nodes_total() == 2);
  assert(resp.nodes_online() == 1);
  assert(resp.nodes_offline() == 1);
  assert(resp.nodes_unknown() == 0);
  assert(resp.instances_total() == 2);
  assert(h.stack.http->requests().size() == calls);
}

void TestGetNodeStatsReportsReachability() {
  ServiceHarness h;
  h.stack.Healthy("10.0.0.1", 3001);
  const auto id = h.Create("10.0.0.1", 3001);

  h.stack.http->OnJson("10.0.0.1", 3001, "/stats", R"({"uptime":"1d 2h 3m","memoryUsage":"1.2 GB"})");
  GetNodeStatsRequest req;
  req.set_id(id);
  auto resp = h.service->GetNodeStats(req);
  assert(resp.node().status() == NODE_STATUS_ONLINE);
  assert(resp.stats().reachable());
  assert(resp.stats().stats().fields().at("memoryUsage").string_value() == "1.2 GB");

  h.stack.http->OnJson("10.0.0.1", 3001, "/stats", R"({"uptime":"0d 0h 0m"})");
  resp = h.service->GetNodeStats(req);
  assert(!resp.stats().reachable());

  // node went away: probed offline, no stats call
  h.stack.http->Clear("10.0.0.1", 3001, "/");
  const auto stats_calls = h.stack.http->CallCount("/stats");
  resp                   = h.service->GetNodeStats(req);
  assert(resp.node().status() == NODE_STATUS_OFFLINE);
  assert(!resp.stats().reachable());
  assert(h.stack.http->CallCount("/stats") == stats_calls);
}

void TestRadarCheckSuspendsFlaggedInstances() {
  ServiceHarness h;
  h.stack.Healthy("10.0.0.1", 3001);
  const auto a = h.Create("10.0.0.1", 3001);
  h.Create("10.0.0.2", 3002);

  h.stack.http->OnJson("10.0.0.1", 3001, "/check/all", R"({"flaggedMessages":[{"containerId":"c1","message":"abuse"}]})");
  h.stack.kv->Set("instances", R"([{"Id":"i1","Node":{"id":")" + a + R"("},"ContainerId":"c1"},{"Id":"i2","ContainerId":"c2"}])");

  const auto resp = h.service->RadarCheck(RadarCheckRequest{});
  assert(resp.nodes_checked() == 1);
  assert(resp.flagged_containers() == 1);
  assert(resp.instances_suspended() == 1);

  const auto instances = h.stack.instances->List();
  assert(instances[0].suspended && instances[0].suspended_flag == "abuse");
  assert(!instances[1].suspended);
}

void TestMutationsAreAudited() {
  ServiceHarness h;
  const auto     id = h.Create("10.0.0.1", 3001);

  IssueConfigureCommandRequest issue;
  issue.set_id(id);
  issue.set_panel_url("https://panel.example");
  const auto command = h.service->IssueConfigureCommand(issue, h.actor);
  assert(command.node_id() == id);
  assert(command.configure_command().rfind("npm run configure -- --panel https://panel.example --key ", 0) == 0);

  DeleteNodeRequest del;
  del.set_id(id);
  h.service->DeleteNode(del, h.actor);

  const auto entries = h.audit->List();
  assert(entries.size() == 3);
  assert(entries[0].action == "node:create");
  assert(entries[1].action == "node:configure-command");
  assert(entries[2].action == "node:delete");
  assert(entries[2].user_id == "u-1");
  assert(entries[2].username == "root");
  assert(entries[2].ip == "ipv4:10.10.0.5:40000");
}

void TestFailedMutationIsNotAudited() {
  ServiceHarness h;

  UpdateNodeRequest req;
  req.set_id("missing");
  req.mutable_spec()->set_address("10.0.0.1");
  req.mutable_spec()->set_port(1);
  req.mutable_spec()->set_api_key("k");

  bool threw = false;
  try {
    h.service->UpdateNode(req, h.actor);
  } catch (const std::exception&) {
    threw = true;
  }
  assert(threw);
  assert(h.audit->List().empty());
}

} // namespace

int main() {
  TestListNodesRefreshesAndCountsInstances();
  TestStatsCountsStoredStatusWithoutProbing();
  TestGetNodeStatsReportsReachability();
  TestRadarCheckSuspendsFlaggedInstances();
  TestMutationsAreAudited();
  TestFailedMutationIsNotAudited();

  std::cout << "fleet_registry_unit_node_admin_service: pass\n";
  return 0;
}
