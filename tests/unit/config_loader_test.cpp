#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using offsync::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "offsync_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool LoadFails(const std::string& test_name, const std::string& yaml_content) {
  const auto yaml_path = WriteYaml(test_name, yaml_content);
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestDefaultsFillUnsetFields() {
  const auto yaml_path = WriteYaml("defaults", R"(database:
  memory: {}
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_memory());
  assert(config.sync().max_attempts() == 5);
  assert(config.sync().base_backoff_ms() == 1000);
  assert(config.sync().max_backoff_ms() == 30000);
  assert(config.sync().jitter_ms() == 250);
  assert(config.sync().max_parallel_targets() == 4);
  assert(!config.sync().start_offline());
  assert(config.cache().prune_interval_ms() == 60000);
  assert(config.cache().default_max_entries() == 1000);
  assert(config.priorities().at("orders") == 1);
  assert(config.priorities().at("maintenance") == 4);
  assert(config.remote().endpoint() == "localhost:50070");
  assert(config.control().bind_address() == "127.0.0.1:50071");
  assert(config.logging().level() == "info");
  assert(!config.observability().metrics_enabled());
  assert(config.observability().collection_interval_ms() == 10000);
  assert(config.observability().service_name() == "offsyncd");
}

void TestObservabilitySection() {
  const auto yaml_path = WriteYaml("observability", R"(database:
  memory: {}
observability:
  metrics_enabled: true
  otlp_endpoint: "http://collector:4318/v1/metrics"
  transport: OTLP_TRANSPORT_HTTP
  collection_interval_ms: 5000
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.observability().metrics_enabled());
  assert(config.observability().otlp_endpoint() == "http://collector:4318/v1/metrics");
  assert(config.observability().transport() == offsync::runtime::config::OTLP_TRANSPORT_HTTP);
  assert(config.observability().collection_interval_ms() == 5000);
}

void TestExplicitValuesWin() {
  const auto yaml_path = WriteYaml("explicit", R"(logging:
  level: debug
database:
  sqlite:
    path: "/var/lib/offsync/offsync.db"
    relaxed_sync: true
sync:
  max_attempts: 8
  base_backoff_ms: 500
  max_backoff_ms: 10000
  jitter_ms: 0
  start_offline: true
cache:
  default_freshness_ms: 60000
  collections:
    orders:
      freshness_ms: 30000
priorities:
  invoices: 2
remote:
  endpoint: "sync.example.net:443"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.database().sqlite().path() == "/var/lib/offsync/offsync.db");
  assert(config.database().sqlite().relaxed_sync());
  assert(config.sync().max_attempts() == 8);
  assert(config.sync().base_backoff_ms() == 500);
  assert(config.sync().has_jitter_ms());
  assert(config.sync().jitter_ms() == 0);
  assert(config.sync().start_offline());
  assert(config.cache().default_freshness_ms() == 60000);
  assert(config.cache().collections().at("orders").freshness_ms() == 30000);
  // configured priorities replace the built-in table
  assert(config.priorities().size() == 1);
  assert(config.priorities().at("invoices") == 2);
  assert(config.remote().endpoint() == "sync.example.net:443");
}

void TestQuotedScalarsStayStrings() {
  const auto yaml_path = WriteYaml("quoted", R"(database:
  sqlite:
    path: "C:\\offsync\\\"quoted\"\\007"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\offsync\\\"quoted\"\\007");
}

void TestUnknownFieldsAreRejected() {
  assert(LoadFails("unknown_field", R"(database:
  memory: {}
unknown_field: 123
)") && "ConfigLoader must reject unknown fields.");
}

void TestValidation() {
  assert(LoadFails("backoff_order", R"(sync:
  base_backoff_ms: 5000
  max_backoff_ms: 1000
)"));

  assert(LoadFails("empty_sqlite_path", R"(database:
  sqlite:
    relaxed_sync: true
)"));

  assert(LoadFails("freshness_past_expiry", R"(cache:
  collections:
    orders:
      freshness_ms: 7200000
      hard_expiry_ms: 3600000
)"));

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/offsync.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestApplyDefaultsIsIdempotent() {
  offsync::runtime::config::RuntimeConfig config;
  config.mutable_sync()->set_max_attempts(3);
  config.mutable_remote()->set_endpoint("remote:1");
  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::ApplyDefaults(config);
  assert(config.sync().max_attempts() == 3);
  assert(config.sync().base_backoff_ms() == 1000);
  assert(config.priorities().size() == 4);
  assert(config.remote().endpoint() == "remote:1");
  ConfigLoader::Validate(config);
}

} // namespace

int main() {
  TestDefaultsFillUnsetFields();
  TestExplicitValuesWin();
  TestObservabilitySection();
  TestQuotedScalarsStayStrings();
  TestUnknownFieldsAreRejected();
  TestValidation();
  TestApplyDefaultsIsIdempotent();

  std::cout << "offsync_unit_config_loader: pass\n";
  return 0;
}
