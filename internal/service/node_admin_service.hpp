#pragma once

#include <google/protobuf/empty.pb.h>

#include <string>

#include "fleet/registry/v1/node_admin_service.pb.h"
#include "service_context.hpp"

namespace fleet::service {

// Who issued an admin request, for the audit log.
struct AuditActor {
  std::string user_id;
  std::string username;
  std::string ip;
};

class NodeAdminService {
public:
  explicit NodeAdminService(ServiceContext ctx);

  fleet::registry::v1::NodeResponse CreateNode(const fleet::registry::v1::CreateNodeRequest& req, const AuditActor& actor);
  fleet::registry::v1::NodeResponse UpdateNode(const fleet::registry::v1::UpdateNodeRequest& req, const AuditActor& actor);
  void DeleteNode(const fleet::registry::v1::DeleteNodeRequest& req, const AuditActor& actor);

  fleet::registry::v1::ListNodesResponse ListNodes(const fleet::registry::v1::ListNodesRequest& req);
  fleet::registry::v1::NodeResponse GetNode(const fleet::registry::v1::GetNodeRequest& req);
  fleet::registry::v1::GetNodeStatsResponse GetNodeStats(const fleet::registry::v1::GetNodeStatsRequest& req);
  fleet::registry::v1::RadarCheckResponse RadarCheck(const fleet::registry::v1::RadarCheckRequest& req);

  fleet::registry::v1::IssueConfigureCommandResponse
  IssueConfigureCommand(const fleet::registry::v1::IssueConfigureCommandRequest& req, const AuditActor& actor);
  void ConfigureNode(const fleet::registry::v1::ConfigureNodeRequest& req, const AuditActor& actor);

  fleet::registry::v1::StatsResponse Stats(const fleet::registry::v1::StatsRequest& req);

private:
  void Audit(const AuditActor& actor, const std::string& action);

  ServiceContext ctx_;
};

}
