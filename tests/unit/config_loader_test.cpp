#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using eventlog::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "eventlog_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool LoadThrows(const std::filesystem::path& path) {
  try {
    (void)ConfigLoader::LoadFromYaml(path.string());
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestEmptyDocumentYieldsDefaults() {
  const auto yaml_path = WriteYaml("empty", "");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.watcher().channel() == "run_events");
  assert(config.watcher().poll_interval_ms() == 250);
  assert(!config.watcher().reconnect().enabled());
  assert(config.watcher().reconnect().initial_backoff_ms() == 100);
  assert(config.watcher().reconnect().max_backoff_ms() == 5000);
  assert(!config.database().has_postgres());
  assert(!config.database().has_sqlite());
}

void TestFullDocument() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
  pattern: "[%l] %v"
database:
  postgres:
    connection_uri: "postgresql://events@localhost/events"
    max_connections: 8
watcher:
  channel: run_events_test
  poll_interval_ms: 100
  reconnect:
    enabled: true
    max_attempts: 5
    initial_backoff_ms: 50
    max_backoff_ms: 800
observability:
  metrics_enabled: false
  transport: OTLP_TRANSPORT_HTTP
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "[%l] %v");
  assert(config.database().has_postgres());
  assert(config.database().postgres().connection_uri() == "postgresql://events@localhost/events");
  assert(config.database().postgres().max_connections() == 8);
  assert(config.watcher().channel() == "run_events_test");
  assert(config.watcher().poll_interval_ms() == 100);
  assert(config.watcher().reconnect().enabled());
  assert(config.watcher().reconnect().max_attempts() == 5);
  assert(config.watcher().reconnect().initial_backoff_ms() == 50);
  assert(config.watcher().reconnect().max_backoff_ms() == 800);
  assert(config.observability().transport() == eventlog::runtime::config::OTLP_TRANSPORT_HTTP);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\eventlog\\\"quoted\"\\db.sqlite"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\eventlog\\\"quoted\"\\db.sqlite");
}

void TestQuotedNumberStaysString() {
  const auto yaml_path = WriteYaml("quoted_number",
                                   R"(watcher:
  channel: "1234"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.watcher().channel() == "1234");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(watcher:
  channel: run_events
  unknown_field: 123
)");

  assert(LoadThrows(yaml_path) && "ConfigLoader must reject unknown fields.");
}

void TestInvalidCombinationsAreRejected() {
  assert(LoadThrows(WriteYaml("backoff_order", R"(watcher:
  reconnect:
    initial_backoff_ms: 1000
    max_backoff_ms: 10
)")));

  assert(LoadThrows(WriteYaml("postgres_without_uri", R"(database:
  postgres:
    max_connections: 2
)")));

  assert(LoadThrows(WriteYaml("sqlite_without_path", R"(database:
  sqlite: {}
)")));
}

void TestMissingFileIsReported() {
  assert(LoadThrows(std::filesystem::temp_directory_path() / "eventlog_config_loader_tests" / "does_not_exist.yaml"));
}

} // namespace

int main() {
  TestEmptyDocumentYieldsDefaults();
  TestFullDocument();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumberStaysString();
  TestUnknownFieldsAreRejected();
  TestInvalidCombinationsAreRejected();
  TestMissingFileIsReported();

  std::cout << "eventlog_unit_config_loader: pass\n";
  return 0;
}
