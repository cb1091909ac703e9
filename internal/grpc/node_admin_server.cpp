#include "node_admin_server.hpp"

#include <string>

#include "grpc_error.hpp"
#include "fleet/registry/v1.hpp"

namespace fleet::grpc {

using namespace fleet::registry::v1;

namespace {

std::string MetadataValue(const ::grpc::ServerContext* ctx, const char* key) {
  const auto& metadata = ctx->client_metadata();
  const auto  it       = metadata.find(key);
  if (it == metadata.end()) {
    return {};
  }
  return std::string(it->second.data(), it->second.length());
}

} // namespace

fleet::service::AuditActor ActorFrom(const ::grpc::ServerContext* ctx) {
  fleet::service::AuditActor actor;
  if (!ctx) {
    return actor;
  }
  actor.user_id  = MetadataValue(ctx, kUserIdMetadata);
  actor.username = MetadataValue(ctx, kUsernameMetadata);
  actor.ip       = ctx->peer();
  return actor;
}

NodeAdminServer::NodeAdminServer(std::shared_ptr<fleet::service::NodeAdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status NodeAdminServer::CreateNode(::grpc::ServerContext* ctx, const CreateNodeRequest* req, NodeResponse* resp) {
  try {
    *resp = service_->CreateNode(*req, ActorFrom(ctx));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status NodeAdminServer::UpdateNode(::grpc::ServerContext* ctx, const UpdateNodeRequest* req, NodeResponse* resp) {
  try {
    *resp = service_->UpdateNode(*req, ActorFrom(ctx));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status NodeAdminServer::DeleteNode(::grpc::ServerContext* ctx, const DeleteNodeRequest* req, google::protobuf::Empty*) {
  try {
    service_->DeleteNode(*req, ActorFrom(ctx));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status NodeAdminServer::ListNodes(::grpc::ServerContext*, const ListNodesRequest* req, ListNodesResponse* resp) {
  try {
    *resp = service_->ListNodes(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status NodeAdminServer::GetNode(::grpc::ServerContext*, const GetNodeRequest* req, NodeResponse* resp) {
  try {
    *resp = service_->GetNode(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status NodeAdminServer::GetNodeStats(::grpc::ServerContext*, const GetNodeStatsRequest* req, GetNodeStatsResponse* resp) {
  try {
    *resp = service_->GetNodeStats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status NodeAdminServer::RadarCheck(::grpc::ServerContext*, const RadarCheckRequest* req, RadarCheckResponse* resp) {
  try {
    *resp = service_->RadarCheck(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status NodeAdminServer::IssueConfigureCommand(::grpc::ServerContext* ctx, const IssueConfigureCommandRequest* req,
                                                      IssueConfigureCommandResponse* resp) {
  try {
    *resp = service_->IssueConfigureCommand(*req, ActorFrom(ctx));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status NodeAdminServer::ConfigureNode(::grpc::ServerContext* ctx, const ConfigureNodeRequest* req, google::protobuf::Empty*) {
  try {
    service_->ConfigureNode(*req, ActorFrom(ctx));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status NodeAdminServer::Stats(::grpc::ServerContext*, const StatsRequest* req, StatsResponse* resp) {
  try {
    *resp = service_->Stats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace fleet::grpc
