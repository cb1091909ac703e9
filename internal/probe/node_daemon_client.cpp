#include "node_daemon_client.hpp"

#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/registry/json_codec.hpp"

namespace fleet::probe {

namespace {

const google::protobuf::Value* Find(const google::protobuf::Struct& object, const std::string& key) {
  const auto it = object.fields().find(key);
  if (it == object.fields().end() || it->second.kind_case() == google::protobuf::Value::kNullValue) {
    return nullptr;
  }
  return &it->second;
}

std::optional<std::string> OptionalString(const google::protobuf::Struct& object, const std::string& key) {
  if (!Find(object, key)) {
    return std::nullopt;
  }
  return registry::codec::StringField(object, key);
}

std::optional<bool> OptionalBool(const google::protobuf::Struct& object, const std::string& key) {
  if (!Find(object, key)) {
    return std::nullopt;
  }
  return registry::codec::BoolField(object, key);
}

} // namespace

NodeDaemonClient::NodeDaemonClient(std::shared_ptr<HttpClient> http, ProbeOptions options)
    : http_(std::move(http)), options_(std::move(options)) {
  if (!http_) {
    throw std::invalid_argument("NodeDaemonClient requires an HttpClient");
  }
}

HttpResponse NodeDaemonClient::Call(const registry::model::NodeRecord& node, const std::string& path) const {
  HttpRequest request;
  request.host     = node.address;
  request.port     = node.port;
  request.path     = path;
  request.username = options_.username;
  request.password = node.api_key;
  request.timeout  = options_.timeout;
  return http_->Get(request);
}

std::optional<google::protobuf::Struct> NodeDaemonClient::CallForObject(const registry::model::NodeRecord& node, const std::string& path,
                                                                        std::string* error) const {
  const auto response = Call(node, path);
  if (response.status == 0) {
    *error = response.error.empty() ? "no response" : response.error;
    return std::nullopt;
  }
  if (!response.ok()) {
    *error = "HTTP " + std::to_string(response.status);
    return std::nullopt;
  }

  google::protobuf::Value body;
  try {
    body = registry::codec::ParseJson(response.body);
  } catch (const std::exception& e) {
    *error = std::string("malformed body: ") + e.what();
    return std::nullopt;
  }
  if (body.kind_case() != google::protobuf::Value::kStructValue) {
    *error = "body is not a JSON object";
    return std::nullopt;
  }
  return body.struct_value();
}

StatusReply NodeDaemonClient::FetchStatus(const registry::model::NodeRecord& node) const {
  StatusReply reply;
  const auto  body = CallForObject(node, "/", &reply.error);
  if (!body) {
    return reply;
  }

  reply.reachable              = true;
  reply.status.version_family  = OptionalString(*body, "versionFamily");
  reply.status.version_release = OptionalString(*body, "versionRelease");
  reply.status.remote          = OptionalBool(*body, "remote");
  reply.status.docker          = OptionalBool(*body, "docker");
  reply.status.online          = OptionalBool(*body, "online");
  return reply;
}

std::optional<google::protobuf::Struct> NodeDaemonClient::FetchStats(const registry::model::NodeRecord& node) const {
  std::string error;
  auto        body = CallForObject(node, "/stats", &error);
  if (!body) {
    FLEET_LOG_WARN("node stats unavailable", {observability::StringField("node_id", node.id), observability::StringField("error", error)});
  }
  return body;
}

std::optional<std::unordered_map<std::string, std::string>> NodeDaemonClient::CheckFlagged(const registry::model::NodeRecord& node) const {
  std::string error;
  const auto  body = CallForObject(node, "/check/all", &error);
  if (!body) {
    FLEET_LOG_WARN("radar check failed", {observability::StringField("node_id", node.id), observability::StringField("error", error)});
    return std::nullopt;
  }

  std::unordered_map<std::string, std::string> flagged;

  const auto it = body->fields().find("flaggedMessages");
  if (it == body->fields().end() || it->second.kind_case() != google::protobuf::Value::kListValue) {
    return flagged;
  }

  for (const auto& entry : it->second.list_value().values()) {
    if (entry.kind_case() != google::protobuf::Value::kStructValue) {
      continue;
    }
    const auto container_id = registry::codec::StringField(entry.struct_value(), "containerId");
    if (container_id.empty()) {
      continue;
    }
    flagged[container_id] = registry::codec::StringField(entry.struct_value(), "message");
  }
  return flagged;
}

bool NodeDaemonClient::PurgeInstances(const registry::model::NodeRecord& node) const {
  const auto response = Call(node, "/instances/purge/all");
  if (!response.ok()) {
    FLEET_LOG_WARN("instance purge failed",
                   {observability::StringField("node_id", node.id),
                    observability::StringField("error", response.status == 0 ? response.error : "HTTP " + std::to_string(response.status))});
    return false;
  }
  return true;
}

} // namespace fleet::probe
