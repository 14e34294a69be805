#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace alo::config {

using alo::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars stay strings ("8080", "true")
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

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

static RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  RuntimeConfig config;

  // an empty document is an all-defaults config
  if (yaml.IsNull()) {
    ConfigLoader::ApplyDefaults(config);
    ConfigLoader::Validate(config);
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) server->set_bind_address("0.0.0.0:50061");

  auto* database = config.mutable_database();
  if (database->backend_case() == alo::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    database->mutable_memory();
  }
  if (database->has_postgres() && database->postgres().max_connections() == 0) {
    database->mutable_postgres()->set_max_connections(16);
  }

  auto* segments = config.mutable_segments();
  if (segments->duplicate_type_policy().empty()) segments->set_duplicate_type_policy("reject");
  if (segments->value_cache_ttl_ms() == 0) segments->set_value_cache_ttl_ms(60000);

  auto* scheduler = config.mutable_scheduler();
  if (scheduler->interval_ms() == 0) scheduler->set_interval_ms(300000);
  if (scheduler->sweep_batch() == 0) scheduler->set_sweep_batch(100);

  auto* delivery = config.mutable_delivery();
  if (delivery->workers() == 0) delivery->set_workers(1);
  if (delivery->batch_size() == 0) delivery->set_batch_size(500);
  if (delivery->max_concurrency() == 0) delivery->set_max_concurrency(16);
  if (delivery->poll_interval_ms() == 0) delivery->set_poll_interval_ms(5000);
  if (delivery->claim_lease_ms() == 0) delivery->set_claim_lease_ms(120000);

  auto* retry = delivery->mutable_retry();
  if (retry->max_attempts() == 0) retry->set_max_attempts(5);
  if (retry->base_backoff_ms() == 0) retry->set_base_backoff_ms(1000);
  if (retry->max_backoff_ms() == 0) retry->set_max_backoff_ms(300000);

  auto* push = config.mutable_push();
  if (push->transport_case() == alo::runtime::config::PushConfig::TRANSPORT_NOT_SET) {
    push->mutable_dry_run();
  }
  if (push->has_grpc_gateway()) {
    auto* gateway = push->mutable_grpc_gateway();
    if (gateway->timeout_ms() == 0) gateway->set_timeout_ms(10000);
    if (gateway->ttl_seconds() == 0) gateway->set_ttl_seconds(86400);
  }

  auto* cleanup = config.mutable_cleanup();
  if (cleanup->retention_days() == 0) cleanup->set_retention_days(31);
  if (cleanup->interval_ms() == 0) cleanup->set_interval_ms(86400000);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& push = config.push();
  if (!push.has_grpc_gateway()) return;

  const uint64_t lease   = config.delivery().claim_lease_ms();
  const uint64_t timeout = push.grpc_gateway().timeout_ms();
  if (timeout * 3 > lease) {
    throw std::runtime_error("Invalid configuration: push.grpc_gateway.timeout_ms (" + std::to_string(timeout) +
                             ") must be at most a third of delivery.claim_lease_ms (" + std::to_string(lease) + ")");
  }
}

} // namespace alo::config
