#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using aggregator::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "batch_aggregator_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    (void)ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfigFromFile() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
database:
  sqlite:
    path: "/var/lib/batch-aggregator/state.db"
logging:
  level: debug
access:
  owner: operator
  providers:
    - sensor-a
    - sensor-b
  paused: false
cooldowns:
  submission: 10s
  decryption_request: 5m
instance:
  id: 6a1c4f0e-2b7d-4c3a-9e58-0d9b1f2a7c64
oracle:
  attestation_key_hex: 0x00ff10ab
  delivery_delay: 250ms
events:
  journal_capacity: 256
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/batch-aggregator/state.db");
  assert(config.logging().level() == "debug");
  assert(config.access().owner() == "operator");
  assert(config.access().providers_size() == 2);
  assert(config.access().providers(1) == "sensor-b");
  assert(!config.access().paused());
  assert(config.cooldowns().submission() == "10s");
  assert(config.cooldowns().decryption_request() == "5m");
  assert(config.instance().id() == "6a1c4f0e-2b7d-4c3a-9e58-0d9b1f2a7c64");
  // Hex keys stay textual even unquoted.
  assert(config.oracle().attestation_key_hex() == "0x00ff10ab");
  assert(config.oracle().delivery_delay() == "250ms");
  assert(config.events().journal_capacity() == 256);
}

void TestMemoryBackendAndDefaults() {
  auto config = ConfigLoader::LoadFromYamlString(R"(database:
  memory: {}
access:
  owner: operator
)");
  assert(config.database().has_memory());
  assert(config.access().providers_size() == 0);
  assert(config.cooldowns().submission().empty());
  assert(config.instance().id().empty());
  assert(config.oracle().attestation_key_hex().empty());
}

void TestQuotedNumericProviderStaysString() {
  auto config = ConfigLoader::LoadFromYamlString(R"(access:
  owner: operator
  providers:
    - "1001"
)");
  assert(config.access().providers(0) == "1001");
}

void TestUnquotedProviderNamesStayStrings() {
  auto config = ConfigLoader::LoadFromYamlString(R"(access:
  owner: 42
  providers:
    - 1001
    - nan
    - inf
    - 1e3
  paused: true
events:
  journal_capacity: 64
)");
  assert(config.access().owner() == "42");
  assert(config.access().providers_size() == 4);
  assert(config.access().providers(0) == "1001");
  assert(config.access().providers(1) == "nan");
  assert(config.access().providers(2) == "inf");
  assert(config.access().providers(3) == "1e3");
  assert(config.access().paused());
  assert(config.events().journal_capacity() == 64);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\aggregator\\\"quoted\"\\db.sqlite"
instance:
  id: 6a1c4f0e-2b7d-4c3a-9e58-0d9b1f2a7c64
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\aggregator\\\"quoted\"\\db.sqlite");
}

void TestUnknownFieldsAreRejected() {
  assert(Rejects(R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
)") && "ConfigLoader must reject unknown fields.");
}

void TestInvalidValuesAreRejected() {
  assert(Rejects("cooldowns:\n  submission: ten seconds\n"));
  assert(Rejects("cooldowns:\n  decryption_request: 5d\n"));
  assert(Rejects("oracle:\n  delivery_delay: fast\n"));
  assert(Rejects("oracle:\n  attestation_key_hex: 0xzz\n"));
  assert(Rejects("oracle:\n  attestation_key_hex: abc\n"));
  assert(Rejects("oracle:\n  attestation_key_hex: 0x\n"));
  assert(Rejects("instance:\n  id: not-a-uuid\n"));
  assert(Rejects("database:\n  sqlite:\n    path: \"\"\n"));
  // a generated instance id would change every stored commitment on restart
  assert(Rejects("database:\n  sqlite:\n    path: /tmp/aggregator.db\n"));
}

void TestOversizedDurationsAreRejected() {
  assert(Rejects("cooldowns:\n  submission: 5000000000000h\n"));
  assert(Rejects("cooldowns:\n  decryption_request: 99999999999999999999999ms\n"));
  assert(Rejects("oracle:\n  delivery_delay: 9223372036854775807s\n"));

  auto config = ConfigLoader::LoadFromYamlString("cooldowns:\n  submission: 876000h\n");
  assert(config.cooldowns().submission() == "876000h");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/batch-aggregator.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigFromFile();
  TestMemoryBackendAndDefaults();
  TestQuotedNumericProviderStaysString();
  TestUnquotedProviderNamesStayStrings();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestUnknownFieldsAreRejected();
  TestInvalidValuesAreRejected();
  TestOversizedDurationsAreRejected();
  TestMissingFileIsReported();

  std::cout << "aggregator_unit_config_loader: pass\n";
  return 0;
}
