#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace offsync::config {

namespace {

constexpr uint32_t kDefaultMaxAttempts       = 5;
constexpr uint64_t kDefaultBaseBackoffMs     = 1000;
constexpr uint64_t kDefaultMaxBackoffMs      = 30000;
constexpr uint64_t kDefaultJitterMs          = 250;
constexpr uint64_t kDefaultRequestTimeoutMs  = 15000;
constexpr uint32_t kDefaultParallelTargets   = 4;
constexpr uint64_t kDefaultPollIntervalMs    = 30000;
constexpr uint64_t kDefaultFreshnessMs       = 5 * 60 * 1000;
constexpr uint64_t kDefaultHardExpiryMs      = 24 * 60 * 60 * 1000;
constexpr uint64_t kDefaultPruneIntervalMs   = 60 * 1000;
constexpr uint64_t kDefaultMaxEntries        = 1000;
constexpr uint64_t kDefaultMetricsIntervalMs = 10 * 1000;
constexpr char     kDefaultRemoteEndpoint[]  = "localhost:50070";
constexpr char     kDefaultControlAddress[]  = "127.0.0.1:50071";

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("007" must not become 7)
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

offsync::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  offsync::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyDefaults(offsync::runtime::config::RuntimeConfig& config) {
  auto* sync = config.mutable_sync();
  if (sync->max_attempts() == 0) sync->set_max_attempts(kDefaultMaxAttempts);
  if (sync->base_backoff_ms() == 0) sync->set_base_backoff_ms(kDefaultBaseBackoffMs);
  if (sync->max_backoff_ms() == 0) sync->set_max_backoff_ms(kDefaultMaxBackoffMs);
  if (sync->request_timeout_ms() == 0) sync->set_request_timeout_ms(kDefaultRequestTimeoutMs);
  if (sync->max_parallel_targets() == 0) sync->set_max_parallel_targets(kDefaultParallelTargets);
  if (sync->poll_interval_ms() == 0) sync->set_poll_interval_ms(kDefaultPollIntervalMs);
  if (!sync->has_jitter_ms()) sync->set_jitter_ms(kDefaultJitterMs);

  auto* cache = config.mutable_cache();
  if (cache->default_freshness_ms() == 0) cache->set_default_freshness_ms(kDefaultFreshnessMs);
  if (cache->default_hard_expiry_ms() == 0) cache->set_default_hard_expiry_ms(kDefaultHardExpiryMs);
  if (cache->prune_interval_ms() == 0) cache->set_prune_interval_ms(kDefaultPruneIntervalMs);
  if (cache->default_max_entries() == 0) cache->set_default_max_entries(kDefaultMaxEntries);

  if (config.priorities().empty()) {
    auto& priorities         = *config.mutable_priorities();
    priorities["orders"]      = 1;
    priorities["companies"]   = 2;
    priorities["products"]    = 3;
    priorities["maintenance"] = 4;
  }

  if (config.remote().endpoint().empty()) config.mutable_remote()->set_endpoint(kDefaultRemoteEndpoint);
  if (config.control().bind_address().empty()) config.mutable_control()->set_bind_address(kDefaultControlAddress);

  if (config.logging().level().empty()) config.mutable_logging()->set_level("info");

  auto* observability = config.mutable_observability();
  if (observability->collection_interval_ms() == 0) observability->set_collection_interval_ms(kDefaultMetricsIntervalMs);
  if (observability->service_name().empty()) observability->set_service_name("offsyncd");
}

void ConfigLoader::Validate(const offsync::runtime::config::RuntimeConfig& config) {
  const auto& sync = config.sync();
  if (sync.max_backoff_ms() < sync.base_backoff_ms()) {
    throw std::runtime_error("Invalid configuration: sync.max_backoff_ms must be >= sync.base_backoff_ms");
  }

  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path must not be empty");
  }

  for (const auto& [collection, policy] : config.cache().collections()) {
    if (collection.empty()) {
      throw std::runtime_error("Invalid configuration: cache.collections has an empty collection name");
    }
    const auto hard_expiry = policy.hard_expiry_ms() ? policy.hard_expiry_ms() : config.cache().default_hard_expiry_ms();
    if (policy.freshness_ms() > hard_expiry) {
      throw std::runtime_error("Invalid configuration: cache.collections." + collection + ".freshness_ms exceeds hard expiry");
    }
  }
}

} // namespace offsync::config
