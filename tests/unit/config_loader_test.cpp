#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using slotkeeper::config::ConfigLoader;
using slotkeeper::runtime::config::DatabaseConfig;
using slotkeeper::runtime::config::MirrorConfig;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "slotkeeper_config_loader_tests";
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
  bind_address: "127.0.0.1:6000"
database:
  sqlite:
    path: "/var/lib/slotkeeper/slotkeeper.db"
    wal_mode: true
logging:
  level: debug
mirror:
  yaml_file:
    path: /srv/mirror.yaml
reconciliation:
  enabled: true
  interval: 30s
  horizon_days: 7
  grace_period: "90s"
coordinator:
  archive_after_hours: 48
observability:
  metrics_enabled: true
  otlp_endpoint: "collector:4318"
  transport: OTLP_TRANSPORT_HTTP
  metrics:
    collection_interval_ms: 5000
projects:
  - project_id: salon
    slot_minutes: 15
    work_start: "08:00"
    work_end: 20:00
    specialists: [Anna, Boris]
    services:
      - name: Haircut
        duration_minutes: 45
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.database().backend_case() == DatabaseConfig::kSqlite);
  assert(config.database().sqlite().path() == "/var/lib/slotkeeper/slotkeeper.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.logging().level() == "debug");
  assert(config.mirror().backend_case() == MirrorConfig::kYamlFile);
  assert(config.mirror().yaml_file().path() == "/srv/mirror.yaml");
  assert(config.reconciliation().enabled());
  assert(config.reconciliation().interval().seconds() == 30);
  assert(config.reconciliation().horizon_days() == 7);
  assert(config.reconciliation().grace_period().seconds() == 90);
  assert(config.coordinator().archive_after_hours() == 48);
  assert(config.observability().metrics_enabled());
  assert(!config.observability().tracing_enabled());
  assert(config.observability().otlp_endpoint() == "collector:4318");
  assert(config.observability().transport() == slotkeeper::runtime::config::OTLP_TRANSPORT_HTTP);
  assert(config.observability().metrics().collection_interval_ms() == 5000);

  auto projects = ConfigLoader::BuildProjects(config);
  const auto& salon = projects.Get("salon");
  assert(salon.slot_minutes == 15);
  assert(salon.work_start.minutes == 8 * 60);
  assert(salon.work_end.minutes == 20 * 60);
  assert(salon.HasSpecialist("Boris"));
  assert(!salon.HasSpecialist("Vera"));
  assert(salon.ServiceSlots("haircut") == 3);
}

void TestDefaultsForEmptyDocument() {
  auto config = ConfigLoader::LoadFromYamlString("");
  assert(config.server().bind_address() == "0.0.0.0:50051");
  assert(config.database().backend_case() == DatabaseConfig::kMemory);
  assert(config.mirror().backend_case() == MirrorConfig::kMemory);
  assert(!config.reconciliation().enabled());
  assert(config.reconciliation().interval().seconds() == 60);
  assert(config.reconciliation().horizon_days() == 14);
  assert(config.reconciliation().grace_period().seconds() == 120);
  assert(config.coordinator().archive_after_hours() == 24);
  assert(ConfigLoader::BuildProjects(config).All().empty());

  auto postgres = ConfigLoader::LoadFromYamlString(R"(database:
  postgres:
    connection_uri: "postgresql://localhost/slotkeeper"
)");
  assert(postgres.database().postgres().pool_size() == 4);
}

void TestQuotedNumbersStayStrings() {
  auto config = ConfigLoader::LoadFromYamlString(R"(projects:
  - project_id: "1234"
    specialists: ["007"]
)");
  assert(config.projects(0).project_id() == "1234");
  assert(config.projects(0).specialists(0) == "007");

  auto projects = ConfigLoader::BuildProjects(config);
  assert(projects.Contains("1234"));
  // unset scheduling fields fall back to project defaults
  assert(projects.Get("1234").slot_minutes == 30);
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
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/slotkeeper.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestMalformedProjectsAreRejected() {
  const char* cases[] = {
      R"(projects:
  - slot_minutes: 30
    specialists: [Anna]
)",
      R"(projects:
  - project_id: a
    specialists: [Anna]
  - project_id: a
    specialists: [Anna]
)",
      R"(projects:
  - project_id: a
    work_start: "18:00"
    work_end: "09:00"
    specialists: [Anna]
)",
      R"(projects:
  - project_id: a
    work_start: "nine"
    specialists: [Anna]
)",
      R"(projects:
  - project_id: a
    specialists: [Anna]
    services:
      - name: Haircut
)",
      R"(projects:
  - project_id: a
)",
      R"(projects:
  - project_id: a
    specialists: [Anna, ""]
)",
  };

  for (const char* yaml : cases) {
    auto config = ConfigLoader::LoadFromYamlString(yaml);
    bool threw  = false;
    try {
      (void)ConfigLoader::BuildProjects(config);
    } catch (const slotkeeper::util::ValidationError&) {
      threw = true;
    }
    assert(threw);
  }
}

} // namespace

int main() {
  TestFullConfigFromFile();
  TestDefaultsForEmptyDocument();
  TestQuotedNumbersStayStrings();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();
  TestMalformedProjectsAreRejected();

  std::cout << "slotkeeper_unit_config_loader: pass\n";
  return 0;
}
