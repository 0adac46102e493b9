#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using wfrun::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "wfrun_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestSqliteBackendWithNumbers() {
  const auto yaml_path = WriteYaml("sqlite_backend",
                                   R"(logging:
  level: debug
database:
  sqlite:
    path: "/tmp/wfrun.db"
    busy_timeout_ms: 2500
engine:
  default_page_limit: 20
  max_page_limit: 200
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/tmp/wfrun.db");
  assert(config.database().sqlite().busy_timeout_ms() == 2500);
  assert(config.engine().default_page_limit() == 20);
  assert(config.engine().max_page_limit() == 200);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  auto config = ConfigLoader::LoadFromString(R"(database:
  sqlite:
    path: "C:\\wfrun\\\"quoted\"\\db.sqlite"
)");
  assert(config.database().sqlite().path() == "C:\\wfrun\\\"quoted\"\\db.sqlite");
}

void TestQuotedNumbersStayStrings() {
  auto config = ConfigLoader::LoadFromString(R"(logging:
  pattern: "1234"
observability:
  service_name: 'true'
)");
  assert(config.logging().pattern() == "1234");
  assert(config.observability().service_name() == "true");
}

void TestEmptyDocumentYieldsDefaults() {
  auto config = ConfigLoader::LoadFromString("");
  assert(!config.has_database());
  assert(!config.database().has_sqlite());
  assert(!config.database().has_postgres());
}

void TestMemoryBackendSelection() {
  auto config = ConfigLoader::LoadFromString(R"(database:
  memory: {}
)");
  assert(config.database().has_memory());
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(database:
  memory: {}
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
    (void)ConfigLoader::LoadFromYaml("/nonexistent/wfrun/config.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestSqliteBackendWithNumbers();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestEmptyDocumentYieldsDefaults();
  TestMemoryBackendSelection();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();

  std::cout << "wfrun_unit_config_loader: pass\n";
  return 0;
}
