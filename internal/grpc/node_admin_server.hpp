#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "fleet/registry/v1/node_admin_service.grpc.pb.h"
#include "internal/service/node_admin_service.hpp"

namespace fleet::grpc {

// metadata keys set by the upstream admin gate
inline constexpr const char* kUserIdMetadata   = "x-fleet-user-id";
inline constexpr const char* kUsernameMetadata = "x-fleet-username";

// Reads the acting admin from request metadata and the peer address.
fleet::service::AuditActor ActorFrom(const ::grpc::ServerContext* ctx);

class NodeAdminServer final : public fleet::registry::v1::NodeAdminService::Service {
public:
  explicit NodeAdminServer(std::shared_ptr<fleet::service::NodeAdminService> svc);

  ::grpc::Status CreateNode(::grpc::ServerContext*, const fleet::registry::v1::CreateNodeRequest*, fleet::registry::v1::NodeResponse*) override;
  ::grpc::Status UpdateNode(::grpc::ServerContext*, const fleet::registry::v1::UpdateNodeRequest*, fleet::registry::v1::NodeResponse*) override;
  ::grpc::Status DeleteNode(::grpc::ServerContext*, const fleet::registry::v1::DeleteNodeRequest*, google::protobuf::Empty*) override;
  ::grpc::Status ListNodes(::grpc::ServerContext*, const fleet::registry::v1::ListNodesRequest*, fleet::registry::v1::ListNodesResponse*) override;
  ::grpc::Status GetNode(::grpc::ServerContext*, const fleet::registry::v1::GetNodeRequest*, fleet::registry::v1::NodeResponse*) override;
  ::grpc::Status GetNodeStats(::grpc::ServerContext*, const fleet::registry::v1::GetNodeStatsRequest*,
                              fleet::registry::v1::GetNodeStatsResponse*) override;
  ::grpc::Status RadarCheck(::grpc::ServerContext*, const fleet::registry::v1::RadarCheckRequest*, fleet::registry::v1::RadarCheckResponse*) override;
  ::grpc::Status IssueConfigureCommand(::grpc::ServerContext*, const fleet::registry::v1::IssueConfigureCommandRequest*,
                                       fleet::registry::v1::IssueConfigureCommandResponse*) override;
  ::grpc::Status ConfigureNode(::grpc::ServerContext*, const fleet::registry::v1::ConfigureNodeRequest*, google::protobuf::Empty*) override;
  ::grpc::Status Stats(::grpc::ServerContext*, const fleet::registry::v1::StatsRequest*, fleet::registry::v1::StatsResponse*) override;

private:
  std::shared_ptr<fleet::service::NodeAdminService> service_;
};

}
