#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "internal/core/node_registry.hpp"
#include "internal/monitor/fleet_monitor.hpp"
#include "internal/monitor/probe_pool.hpp"
#include "internal/probe/health_prober.hpp"
#include "internal/probe/node_daemon_client.hpp"
#include "internal/registry/instance_store.hpp"
#include "internal/registry/node_record_store.hpp"
#include "test_doubles.hpp"

namespace fleet::testing {

// Wires the registry stack over a counting in-memory store and a scripted HTTP client.
struct RegistryHarness {
  explicit RegistryHarness(std::size_t workers = 4, std::chrono::milliseconds refresh_deadline = std::chrono::milliseconds::zero())
      : kv(std::make_shared<CountingKeyValueStore>()),
        http(std::make_shared<FakeHttpClient>()),
        nodes(std::make_shared<registry::NodeRecordStore>(kv)),
        instances(std::make_shared<registry::InstanceStore>(kv)),
        daemon(std::make_shared<probe::NodeDaemonClient>(http, probe::ProbeOptions{})),
        prober(std::make_shared<probe::HealthProber>(daemon, nodes)),
        pool(std::make_shared<monitor::ProbePool>(workers)),
        fleet_monitor(std::make_shared<monitor::FleetMonitor>(nodes, prober, daemon, pool, refresh_deadline)),
        node_registry(std::make_shared<core::NodeRegistry>(nodes, instances, prober, daemon)) {
  }

  // Scripts a healthy daemon at address:port.
  void Healthy(const std::string& address, uint32_t port, const std::string& family = "1", const std::string& release = "1.2.0",
               std::chrono::milliseconds delay = std::chrono::milliseconds::zero()) {
    http->OnJson(address, port, "/",
                 R"({"versionFamily":")" + family + R"(","versionRelease":")" + release + R"(","online":true,"remote":"true","docker":true})",
                 delay);
  }

  static registry::model::NodeSpec Spec(const std::string& address, uint32_t port, const std::string& name = "node") {
    registry::model::NodeSpec spec;
    spec.name    = name;
    spec.address = address;
    spec.port    = port;
    spec.api_key = "key-" + name;
    return spec;
  }

  std::shared_ptr<CountingKeyValueStore>     kv;
  std::shared_ptr<FakeHttpClient>            http;
  std::shared_ptr<registry::NodeRecordStore> nodes;
  std::shared_ptr<registry::InstanceStore>   instances;
  std::shared_ptr<probe::NodeDaemonClient>   daemon;
  std::shared_ptr<probe::HealthProber>       prober;
  std::shared_ptr<monitor::ProbePool>        pool;
  std::shared_ptr<monitor::FleetMonitor>     fleet_monitor;
  std::shared_ptr<core::NodeRegistry>        node_registry;
};

} // namespace fleet::testing
