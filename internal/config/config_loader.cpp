#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace fleet::config {

namespace {

constexpr const char* kDefaultBindAddress   = "0.0.0.0:50051";
constexpr const char* kDefaultProbeUsername = "Skyport";
constexpr uint32_t    kDefaultProbeTimeout  = 3000;
constexpr uint32_t    kDefaultConcurrency   = 16;
constexpr uint32_t    kDefaultRetentionDays = 30;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar = node.Scalar();

  if (scalar == "true" || scalar == "false") {
    value->set_bool_value(scalar == "true");
    return;
  }

  // quoted scalars stay strings so "8080" in a string field is not coerced
  if (node.Tag() != "!" && !scalar.empty()) {
    char*        endptr  = nullptr;
    const double numeric = std::strtod(scalar.c_str(), &endptr);
    if (endptr && *endptr == '\0') {
      value->set_number_value(numeric);
      return;
    }
  }

  value->set_string_value(scalar);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (const auto& item : node) {
        YamlToProtoValue(item, list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (const auto& entry : node) {
        YamlToProtoValue(entry.second, &(*struct_value->mutable_fields())[entry.first.Scalar()]);
      }
      break;
    }
  }
}

fleet::runtime::config::RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  // an empty document yields null; treat it as an empty object
  if (json_value.kind_case() == google::protobuf::Value::kNullValue) {
    json_value.mutable_struct_value();
  }

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  fleet::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(&config);
  return config;
}

} // namespace

void ConfigLoader::ApplyDefaults(fleet::runtime::config::RuntimeConfig* config) {
  if (config->server().bind_address().empty()) {
    config->mutable_server()->set_bind_address(kDefaultBindAddress);
  }

  if (config->database().backend_case() == fleet::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config->mutable_database()->mutable_memory();
  }

  auto* probe = config->mutable_probe();
  if (probe->username().empty()) {
    probe->set_username(kDefaultProbeUsername);
  }
  if (probe->timeout_ms() == 0) {
    probe->set_timeout_ms(kDefaultProbeTimeout);
  }
  if (probe->max_concurrency() == 0) {
    probe->set_max_concurrency(kDefaultConcurrency);
  }

  if (config->audit().retention_days() == 0) {
    config->mutable_audit()->set_retention_days(kDefaultRetentionDays);
  }

  if (config->logging().level().empty()) {
    config->mutable_logging()->set_level("info");
  }
}

fleet::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

fleet::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

} // namespace fleet::config
