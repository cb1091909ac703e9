#pragma once

#include <google/protobuf/struct.pb.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include "internal/probe/http_client.hpp"
#include "internal/registry/model/node_record.hpp"

namespace fleet::probe {

struct ProbeOptions {
  // basic auth username; the node's api key is the password
  std::string               username = "Skyport";
  std::chrono::milliseconds timeout{3000};
};

/*
  Capability report from GET /.
  Fields the daemon did not send stay empty.
*/
struct DaemonStatus {
  std::optional<std::string> version_family;
  std::optional<std::string> version_release;
  std::optional<bool>        remote;
  std::optional<bool>        docker;
  std::optional<bool>        online;
};

struct StatusReply {
  bool         reachable = false;
  std::string  error;
  DaemonStatus status;
};

/*
  Typed calls against a node daemon.

  None of these throw for network or decoding failures; the caller decides
  how a failure is classified.
*/
class NodeDaemonClient {
 public:
  NodeDaemonClient(std::shared_ptr<HttpClient> http, ProbeOptions options);

  // GET /
  StatusReply FetchStatus(const registry::model::NodeRecord& node) const;

  // GET /stats, nullopt unless a JSON object came back
  std::optional<google::protobuf::Struct> FetchStats(const registry::model::NodeRecord& node) const;

  // GET /check/all, containerId -> message of every flagged container
  std::optional<std::unordered_map<std::string, std::string>> CheckFlagged(const registry::model::NodeRecord& node) const;

  // GET /instances/purge/all
  bool PurgeInstances(const registry::model::NodeRecord& node) const;

  const ProbeOptions& options() const {
    return options_;
  }

 private:
  HttpResponse                            Call(const registry::model::NodeRecord& node, const std::string& path) const;
  std::optional<google::protobuf::Struct> CallForObject(const registry::model::NodeRecord& node, const std::string& path, std::string* error) const;

  std::shared_ptr<HttpClient> http_;
  ProbeOptions                options_;
};

} // namespace fleet::probe
