#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using availability::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "availability_engine_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigFromFile() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
database:
  sqlite:
    path: "/tmp/availability.db"
cache:
  enabled: true
  week_ttl_seconds: 120
  day_ttl_seconds: 600
availability:
  slot_minutes: 30
  forbid_past_edits: true
  audit_enabled: true
  default_utc_offset_minutes: 60
  instructor_utc_offset_minutes:
    instructor-nyc: -300
  retention:
    enabled: true
    retention_days: 90
    dry_run: true
observability:
  transport: OTLP_TRANSPORT_HTTP
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/tmp/availability.db");
  assert(config.cache().enabled());
  assert(config.cache().week_ttl_seconds() == 120);
  assert(config.cache().day_ttl_seconds() == 600);
  assert(config.availability().slot_minutes() == 30);
  assert(config.availability().forbid_past_edits());
  assert(config.availability().default_utc_offset_minutes() == 60);
  assert(config.availability().instructor_utc_offset_minutes().at("instructor-nyc") == -300);
  assert(config.availability().retention().enabled());
  assert(config.availability().retention().retention_days() == 90);
  assert(config.availability().retention().dry_run());
  assert(config.observability().transport() == availability::runtime::config::OTLP_TRANSPORT_HTTP);
}

void TestQuotedScalarsStayStrings() {
  const auto config = ConfigLoader::LoadFromString(R"(database:
  postgres:
    connection_uri: "123"
    max_connections: 4
logging:
  level: "true"
)");

  assert(config.database().has_postgres());
  assert(config.database().postgres().connection_uri() == "123");
  assert(config.database().postgres().max_connections() == 4);
  assert(config.logging().level() == "true");
}

void TestEmptyDocumentIsDefaults() {
  const auto config = ConfigLoader::LoadFromString("");
  assert(!config.has_database());
  assert(!config.cache().enabled());
  assert(config.availability().slot_minutes() == 0);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestNonMappingDocumentIsRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromString("- a\n- b\n");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/availability-engine.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigFromFile();
  TestQuotedScalarsStayStrings();
  TestEmptyDocumentIsDefaults();
  TestUnknownFieldsAreRejected();
  TestNonMappingDocumentIsRejected();
  TestMissingFileIsReported();

  std::cout << "availability_unit_config_loader: pass\n";
  return 0;
}
