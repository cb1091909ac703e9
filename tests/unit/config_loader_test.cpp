#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using fleet::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "fleet_registry_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigIsLoaded() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:50061"
database:
  sqlite:
    path: "C:\\fleet\\\"quoted\"\\fleet.db"
    wal_mode: true
probe:
  username: "Skyport"
  timeout_ms: 1500
  max_concurrency: 4
  refresh_deadline_ms: 9000
audit:
  enabled: true
  retention_days: 7
logging:
  level: "debug"
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:50061");
  assert(config.database().sqlite().path() == "C:\\fleet\\\"quoted\"\\fleet.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.probe().timeout_ms() == 1500);
  assert(config.probe().max_concurrency() == 4);
  assert(config.probe().refresh_deadline_ms() == 9000);
  assert(config.audit().enabled());
  assert(config.audit().retention_days() == 7);
  assert(config.logging().level() == "debug");
}

void TestDefaultsApplyToUnsetFields() {
  const auto config = ConfigLoader::LoadFromYamlString("probe:\n  timeout_ms: 500\n");

  assert(config.server().bind_address() == "0.0.0.0:50051");
  assert(config.database().has_memory());
  assert(config.probe().username() == "Skyport");
  assert(config.probe().timeout_ms() == 500);
  assert(config.probe().max_concurrency() == 16);
  assert(config.probe().refresh_deadline_ms() == 0);
  assert(config.audit().retention_days() == 30);
  assert(config.logging().level() == "info");

  const auto empty = ConfigLoader::LoadFromYamlString("");
  assert(empty.probe().timeout_ms() == 3000);
}

void TestQuotedNumericStringStaysString() {
  const auto config = ConfigLoader::LoadFromYamlString("probe:\n  username: \"1234\"\n");
  assert(config.probe().username() == "1234");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && "ConfigLoader must reject unknown fields.");

  threw = false;
  try {
    (void)ConfigLoader::LoadFromYamlString("probe:\n  retries: 3\n");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && "ConfigLoader must reject unknown nested fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/fleet-registry.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigIsLoaded();
  TestDefaultsApplyToUnsetFields();
  TestQuotedNumericStringStaysString();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();

  std::cout << "fleet_registry_unit_config_loader: pass\n";
  return 0;
}
