#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace heartbeat::config {

namespace {

constexpr const char* kDefaultBindAddress = "0.0.0.0:50051";
constexpr const char* kDefaultTenant      = "public";
constexpr uint32_t    kDefaultMaxContexts = 1024;
constexpr uint32_t    kDefaultQueueSize   = 1024;
constexpr uint32_t    kDefaultWorkers     = 2;
constexpr uint32_t    kDefaultTimeoutMs   = 5000;

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  // quoted scalars stay strings ("0123" secrets, numeric-looking tokens)
  if (node.Tag() != "!") {
    char*        endptr        = nullptr;
    const double numeric_value = strtod(scalar_value.c_str(), &endptr);
    if (!scalar_value.empty() && endptr && *endptr == '\0') {
      value->set_number_value(numeric_value);
      return;
    }
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

static heartbeat::runtime::config::RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  heartbeat::runtime::config::RuntimeConfig config;

  // empty document means all defaults
  if (yaml.IsDefined() && !yaml.IsNull()) {
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
  }

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::ApplyEnvironmentOverrides(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

heartbeat::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

heartbeat::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

void ConfigLoader::ApplyDefaults(heartbeat::runtime::config::RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address(kDefaultBindAddress);
  }

  auto* tenants = config.mutable_tenants();
  if (tenants->default_tenant().empty()) {
    tenants->set_default_tenant(kDefaultTenant);
  }
  if (tenants->max_cached_contexts() == 0) {
    tenants->set_max_cached_contexts(kDefaultMaxContexts);
  }

  auto* alerts = config.mutable_alerts();
  if (alerts->queue_capacity() == 0) {
    alerts->set_queue_capacity(kDefaultQueueSize);
  }
  if (alerts->workers() == 0) {
    alerts->set_workers(kDefaultWorkers);
  }
  if (alerts->timeout_ms() == 0) {
    alerts->set_timeout_ms(kDefaultTimeoutMs);
  }

  if (config.database().has_postgres() && config.database().postgres().max_connections() == 0) {
    config.mutable_database()->mutable_postgres()->set_max_connections(16);
  }
}

void ConfigLoader::ApplyEnvironmentOverrides(heartbeat::runtime::config::RuntimeConfig& config) {
  if (const char* secret = std::getenv("HEARTBEAT_SIGNING_SECRET")) {
    config.mutable_security()->set_signing_secret(secret);
  }
  if (const char* token = std::getenv("HEARTBEAT_ADMIN_TOKEN")) {
    config.mutable_security()->set_admin_token(token);
  }
}

} // namespace heartbeat::config
