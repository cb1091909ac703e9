#pragma once

#include <memory>

namespace fleet::core { class NodeRegistry; }
namespace fleet::monitor { class FleetMonitor; }
namespace fleet::registry { class NodeRecordStore; class InstanceStore; }
namespace fleet::probe { class HealthProber; class NodeDaemonClient; }
namespace fleet::audit { class AuditLog; }

namespace fleet::service {

/*
  Dependency container shared by the admin service.

  audit is null when auditing is disabled.
*/
struct ServiceContext {
  std::shared_ptr<fleet::core::NodeRegistry>      registry;
  std::shared_ptr<fleet::monitor::FleetMonitor>   monitor;
  std::shared_ptr<fleet::registry::NodeRecordStore> nodes;
  std::shared_ptr<fleet::registry::InstanceStore> instances;
  std::shared_ptr<fleet::probe::HealthProber>     prober;
  std::shared_ptr<fleet::probe::NodeDaemonClient> daemon;
  std::shared_ptr<fleet::audit::AuditLog>         audit;
};

}
