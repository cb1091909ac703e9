#include <grpcpp/grpcpp.h>
#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <iostream>
#include <string>

#include "fleet/registry/v1.hpp"

using namespace fleet::registry::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  fleetctl <addr> create <address> <port> <api_key> [name]\n"
            << "  fleetctl <addr> update <id> <address> <port> <api_key> [name]\n"
            << "  fleetctl <addr> delete <id> [--with-instances]\n"
            << "  fleetctl <addr> list [id ...]\n"
            << "  fleetctl <addr> get <id>\n"
            << "  fleetctl <addr> node-stats <id>\n"
            << "  fleetctl <addr> radar\n"
            << "  fleetctl <addr> configure-command <id> <panel_url>\n"
            << "  fleetctl <addr> configure <configure_key> <access_key>\n"
            << "  fleetctl <addr> stats\n"
            << "\n"
            << "FLEET_USER_ID and FLEET_USERNAME are sent as the acting admin.\n";
}

static const char* StatusName(NodeStatus status) {
  switch (status) {
    case NODE_STATUS_ONLINE:
      return "Online";
    case NODE_STATUS_OFFLINE:
      return "Offline";
    default:
      return "Unknown";
  }
}

static void PrintNode(const Node& node) {
  std::cout << "id=" << node.id() << " name=" << node.name() << " address=" << node.address() << ":" << node.port()
            << " status=" << StatusName(node.status());
  if (!node.version_family().empty()) {
    std::cout << " version=" << node.version_family() << "/" << node.version_release();
  }
  std::cout << " docker=" << (node.docker() ? "true" : "false") << " remote=" << (node.remote() ? "true" : "false") << "\n";
}

static bool ParsePort(const std::string& text, uint32_t* port) {
  char*      endptr = nullptr;
  const auto value  = std::strtoul(text.c_str(), &endptr, 10);
  if (!endptr || *endptr != '\0' || value == 0 || value > 65535) {
    std::cerr << "invalid port: " << text << "\n";
    return false;
  }
  *port = static_cast<uint32_t>(value);
  return true;
}

static bool FillSpec(int argc, char** argv, int first, NodeSpec* spec) {
  if (argc < first + 3) return false;
  spec->set_address(argv[first]);
  uint32_t port = 0;
  if (!ParsePort(argv[first + 1], &port)) return false;
  spec->set_port(port);
  spec->set_api_key(argv[first + 2]);
  if (argc > first + 3) spec->set_name(argv[first + 3]);
  return true;
}

static int Fail(const grpc::Status& status) {
  std::cerr << "error (" << status.error_code() << "): " << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = NodeAdminService::NewStub(channel);

  grpc::ClientContext ctx;
  if (const char* user_id = std::getenv("FLEET_USER_ID")) ctx.AddMetadata("x-fleet-user-id", user_id);
  if (const char* username = std::getenv("FLEET_USERNAME")) ctx.AddMetadata("x-fleet-username", username);

  // ------------------------------------------------------------

  if (cmd == "create") {
    CreateNodeRequest req;
    if (!FillSpec(argc, argv, 3, req.mutable_spec())) {
      Usage();
      return 1;
    }

    NodeResponse resp;
    auto         status = stub->CreateNode(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintNode(resp.node());
    return 0;
  }

  if (cmd == "update") {
    if (argc < 4) return 1;

    UpdateNodeRequest req;
    req.set_id(argv[3]);
    if (!FillSpec(argc, argv, 4, req.mutable_spec())) {
      Usage();
      return 1;
    }

    NodeResponse resp;
    auto         status = stub->UpdateNode(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintNode(resp.node());
    return 0;
  }

  if (cmd == "delete") {
    if (argc < 4) return 1;

    DeleteNodeRequest req;
    req.set_id(argv[3]);
    req.set_delete_instances(argc >= 5 && std::string(argv[4]) == "--with-instances");

    google::protobuf::Empty resp;
    auto                    status = stub->DeleteNode(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "deleted\n";
    return 0;
  }

  if (cmd == "list") {
    ListNodesRequest req;
    for (int i = 3; i < argc; ++i) req.add_ids(argv[i]);

    ListNodesResponse resp;
    auto              status = stub->ListNodes(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& node : resp.nodes()) PrintNode(node);
    for (const auto& count : resp.instance_counts()) {
      std::cout << "instances node=" << count.node_id() << " count=" << count.count() << "\n";
    }
    return 0;
  }

  if (cmd == "get") {
    if (argc < 4) return 1;

    GetNodeRequest req;
    req.set_id(argv[3]);

    NodeResponse resp;
    auto         status = stub->GetNode(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintNode(resp.node());
    return 0;
  }

  if (cmd == "node-stats") {
    if (argc < 4) return 1;

    GetNodeStatsRequest req;
    req.set_id(argv[3]);

    GetNodeStatsResponse resp;
    auto                 status = stub->GetNodeStats(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintNode(resp.node());
    std::cout << "reachable=" << (resp.stats().reachable() ? "true" : "false") << " instances=" << resp.instance_count() << "\n";

    std::string json;
    if (google::protobuf::util::MessageToJsonString(resp.stats().stats(), &json).ok()) {
      std::cout << json << "\n";
    }
    return 0;
  }

  if (cmd == "radar") {
    RadarCheckRequest  req;
    RadarCheckResponse resp;
    auto               status = stub->RadarCheck(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "nodes_checked=" << resp.nodes_checked() << " flagged=" << resp.flagged_containers()
              << " suspended=" << resp.instances_suspended() << "\n";
    return 0;
  }

  if (cmd == "configure-command") {
    if (argc < 5) return 1;

    IssueConfigureCommandRequest req;
    req.set_id(argv[3]);
    req.set_panel_url(argv[4]);

    IssueConfigureCommandResponse resp;
    auto                          status = stub->IssueConfigureCommand(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << resp.configure_command() << "\n";
    return 0;
  }

  if (cmd == "configure") {
    if (argc < 5) return 1;

    ConfigureNodeRequest req;
    req.set_configure_key(argv[3]);
    req.set_access_key(argv[4]);

    google::protobuf::Empty resp;
    auto                    status = stub->ConfigureNode(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "configured\n";
    return 0;
  }

  if (cmd == "stats") {
    StatsRequest  req;
    StatsResponse resp;
    auto          status = stub->Stats(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "nodes=" << resp.nodes_total() << " online=" << resp.nodes_online() << " offline=" << resp.nodes_offline()
              << " unknown=" << resp.nodes_unknown() << " instances=" << resp.instances_total() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
