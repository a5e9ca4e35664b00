#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using heartbeat::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "heartbeat_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigParsed() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:6000"
database:
  sqlite:
    path: "/var/lib/heartbeat/state.db"
logging:
  level: debug
security:
  signing_secret: "s3cr3t"
  admin_token: "0123"
alerts:
  queue_capacity: 16
  workers: 4
  timeout_ms: 1500
tenants:
  default_tenant: lobby
  max_cached_contexts: 32
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/heartbeat/state.db");
  assert(config.logging().level() == "debug");
  assert(config.security().signing_secret() == "s3cr3t");
  // quoted numerals stay text
  assert(config.security().admin_token() == "0123");
  assert(config.alerts().queue_capacity() == 16);
  assert(config.alerts().workers() == 4);
  assert(config.alerts().timeout_ms() == 1500);
  assert(config.tenants().default_tenant() == "lobby");
  assert(config.tenants().max_cached_contexts() == 32);
}

void TestDefaultsApplied() {
  auto config = ConfigLoader::LoadFromYamlString("");

  assert(config.server().bind_address() == "0.0.0.0:50051");
  assert(!config.database().has_sqlite());
  assert(!config.database().has_postgres());
  assert(config.alerts().queue_capacity() == 1024);
  assert(config.alerts().workers() == 2);
  assert(config.alerts().timeout_ms() == 5000);
  assert(config.tenants().default_tenant() == "public");
  assert(config.tenants().max_cached_contexts() == 1024);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
database:
  sqlite:
    path: "C:\\heartbeat\\\"quoted\"\\db.sqlite"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\heartbeat\\\"quoted\"\\db.sqlite");
}

void TestScalarEscapingForNewlineAndUnicode() {
  auto config = ConfigLoader::LoadFromYamlString(R"(server:
  bind_address: "line1\nline2☃"
)");
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
}

void TestEnvironmentOverridesSecrets() {
  setenv("HEARTBEAT_SIGNING_SECRET", "from-env", 1);
  setenv("HEARTBEAT_ADMIN_TOKEN", "token-env", 1);

  auto config = ConfigLoader::LoadFromYamlString(R"(security:
  signing_secret: "from-file"
)");

  unsetenv("HEARTBEAT_SIGNING_SECRET");
  unsetenv("HEARTBEAT_ADMIN_TOKEN");

  assert(config.security().signing_secret() == "from-env");
  assert(config.security().admin_token() == "token-env");
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

void TestMissingFileRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/heartbeat/config.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  unsetenv("HEARTBEAT_SIGNING_SECRET");
  unsetenv("HEARTBEAT_ADMIN_TOKEN");

  TestFullConfigParsed();
  TestDefaultsApplied();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestEnvironmentOverridesSecrets();
  TestUnknownFieldsAreRejected();
  TestMissingFileRejected();

  std::cout << "heartbeat_unit_config_loader: pass\n";
  return 0;
}
