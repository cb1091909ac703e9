#include "json_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace fleet::registry::codec {

namespace {

// 2^63 and 2^64; doubles at or beyond these do not convert to int64/uint64.
constexpr double kInt64Bound  = 9223372036854775808.0;
constexpr double kUint64Bound = 18446744073709551616.0;

constexpr uint64_t kMaxPort = 65535;

void SetString(google::protobuf::Struct* object, const std::string& key, const std::string& value) {
  (*object->mutable_fields())[key].set_string_value(value);
}

void SetBool(google::protobuf::Struct* object, const std::string& key, bool value) {
  (*object->mutable_fields())[key].set_bool_value(value);
}

void SetNumber(google::protobuf::Struct* object, const std::string& key, double value) {
  (*object->mutable_fields())[key].set_number_value(value);
}

const google::protobuf::Value* Find(const google::protobuf::Struct& object, const std::string& key) {
  const auto it = object.fields().find(key);
  if (it == object.fields().end()) {
    return nullptr;
  }
  return &it->second;
}

} // namespace

google::protobuf::Value ParseJson(const std::string& json) {
  google::protobuf::Value value;
  auto                    status = google::protobuf::util::JsonStringToMessage(json, &value);
  if (!status.ok()) {
    throw std::runtime_error("Invalid JSON value: " + std::string(status.message()));
  }
  return value;
}

std::string ToJson(const google::protobuf::Value& value) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(value, &json);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize JSON value: " + std::string(status.message()));
  }
  return json;
}

std::string StringField(const google::protobuf::Struct& object, const std::string& key) {
  const auto* value = Find(object, key);
  if (!value) {
    return {};
  }

  switch (value->kind_case()) {
    case google::protobuf::Value::kStringValue:
      return value->string_value();
    case google::protobuf::Value::kNumberValue: {
      const double number = value->number_value();
      if (std::floor(number) == number && number >= -kInt64Bound && number < kInt64Bound) {
        return std::to_string(static_cast<int64_t>(number));
      }
      return std::to_string(number);
    }
    case google::protobuf::Value::kBoolValue:
      return value->bool_value() ? "true" : "false";
    default:
      return {};
  }
}

bool BoolField(const google::protobuf::Struct& object, const std::string& key) {
  const auto* value = Find(object, key);
  if (!value) {
    return false;
  }
  if (value->kind_case() == google::protobuf::Value::kBoolValue) {
    return value->bool_value();
  }
  if (value->kind_case() == google::protobuf::Value::kStringValue) {
    return value->string_value() == "true";
  }
  return false;
}

uint64_t UnsignedField(const google::protobuf::Struct& object, const std::string& key) {
  const auto* value = Find(object, key);
  if (!value) {
    return 0;
  }
  if (value->kind_case() == google::protobuf::Value::kNumberValue) {
    const double number = value->number_value();
    return number > 0 && number < kUint64Bound ? static_cast<uint64_t>(number) : 0;
  }
  if (value->kind_case() == google::protobuf::Value::kStringValue) {
    const auto& text = value->string_value();
    if (text.empty() || text.front() == '-') {
      return 0;
    }
    char* endptr = nullptr;
    errno        = 0;
    const auto parsed = std::strtoull(text.c_str(), &endptr, 10);
    if (errno != ERANGE && endptr && *endptr == '\0') {
      return parsed;
    }
  }
  return 0;
}

model::NodeStatus ParseStatus(const std::string& text) {
  if (text == "Online") {
    return model::NodeStatus::Online;
  }
  if (text == "Offline") {
    return model::NodeStatus::Offline;
  }
  return model::NodeStatus::Unknown;
}

std::string EncodeNode(const model::NodeRecord& node) {
  google::protobuf::Value value;
  auto*                   object = value.mutable_struct_value();

  SetString(object, "id", node.id);
  SetString(object, "name", node.name);
  SetString(object, "tags", node.tags);
  SetString(object, "ram", node.ram);
  SetString(object, "disk", node.disk);
  SetString(object, "processor", node.processor);
  SetString(object, "address", node.address);
  SetNumber(object, "port", static_cast<double>(node.port));
  SetString(object, "apiKey", node.api_key);
  SetString(object, "status", model::ToString(node.status));
  SetString(object, "versionFamily", node.version_family);
  SetString(object, "versionRelease", node.version_release);
  SetBool(object, "remote", node.remote);
  SetBool(object, "docker", node.docker);
  SetNumber(object, "lastProbedAt", static_cast<double>(node.last_probed_at_ms));
  if (!node.configure_key.empty()) {
    SetString(object, "configureKey", node.configure_key);
  } else {
    (*object->mutable_fields())["configureKey"].set_null_value(google::protobuf::NULL_VALUE);
  }

  return ToJson(value);
}

model::NodeRecord DecodeNode(const std::string& json) {
  const auto value = ParseJson(json);
  if (value.kind_case() != google::protobuf::Value::kStructValue) {
    throw std::runtime_error("Node record is not a JSON object");
  }

  const auto&       object = value.struct_value();
  model::NodeRecord node;
  node.id                = StringField(object, "id");
  node.name              = StringField(object, "name");
  node.tags              = StringField(object, "tags");
  node.ram               = StringField(object, "ram");
  node.disk              = StringField(object, "disk");
  node.processor         = StringField(object, "processor");
  node.address           = StringField(object, "address");
  node.port              = static_cast<uint32_t>(std::min(UnsignedField(object, "port"), kMaxPort));
  node.api_key           = StringField(object, "apiKey");
  node.status            = ParseStatus(StringField(object, "status"));
  node.version_family    = StringField(object, "versionFamily");
  node.version_release   = StringField(object, "versionRelease");
  node.remote            = BoolField(object, "remote");
  node.docker            = BoolField(object, "docker");
  node.last_probed_at_ms = UnsignedField(object, "lastProbedAt");
  node.configure_key     = StringField(object, "configureKey");
  return node;
}

std::string EncodeIds(const std::vector<std::string>& ids) {
  google::protobuf::Value value;
  auto*                   list = value.mutable_list_value();
  for (const auto& id : ids) {
    list->add_values()->set_string_value(id);
  }
  return ToJson(value);
}

std::vector<std::string> DecodeIds(const std::string& json) {
  const auto value = ParseJson(json);
  if (value.kind_case() == google::protobuf::Value::kNullValue) {
    return {};
  }
  if (value.kind_case() != google::protobuf::Value::kListValue) {
    throw std::runtime_error("Node index is not a JSON array");
  }

  std::vector<std::string> ids;
  ids.reserve(value.list_value().values_size());
  for (const auto& item : value.list_value().values()) {
    if (item.kind_case() == google::protobuf::Value::kStringValue) {
      ids.push_back(item.string_value());
    }
  }
  return ids;
}

model::Instance DecodeInstance(const google::protobuf::Value& value) {
  model::Instance instance;
  if (value.kind_case() != google::protobuf::Value::kStructValue) {
    return instance;
  }

  const auto& object      = value.struct_value();
  instance.id             = StringField(object, "Id");
  instance.container_id   = StringField(object, "ContainerId");
  instance.user           = StringField(object, "User");
  instance.suspended      = BoolField(object, "suspended");
  instance.suspended_flag = StringField(object, "suspended-flagg");

  const auto* owner = Find(object, "Node");
  if (owner && owner->kind_case() == google::protobuf::Value::kStructValue) {
    instance.node_id = StringField(owner->struct_value(), "id");
  }
  if (instance.node_id.empty()) {
    instance.node_id = StringField(object, "node");
  }
  return instance;
}

google::protobuf::Value EncodeAuditEntry(const model::AuditEntry& entry) {
  google::protobuf::Value value;
  auto*                   object = value.mutable_struct_value();
  SetString(object, "userId", entry.user_id);
  SetString(object, "username", entry.username);
  SetString(object, "action", entry.action);
  SetString(object, "ip", entry.ip);
  SetString(object, "timestamp", entry.timestamp);
  return value;
}

model::AuditEntry DecodeAuditEntry(const google::protobuf::Value& value) {
  model::AuditEntry entry;
  if (value.kind_case() != google::protobuf::Value::kStructValue) {
    return entry;
  }

  const auto& object = value.struct_value();
  entry.user_id      = StringField(object, "userId");
  entry.username     = StringField(object, "username");
  entry.action       = StringField(object, "action");
  entry.ip           = StringField(object, "ip");
  entry.timestamp    = StringField(object, "timestamp");
  return entry;
}

} // namespace fleet::registry::codec
