#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace forge::config {

namespace {

constexpr const char* kDefaultBindAddress     = "0.0.0.0:50061";
constexpr const char* kDefaultStatusDirectory = ".forge/status";
constexpr const char* kDefaultSqlitePath      = "forge.db";
constexpr uint32_t    kDefaultQueueCapacity   = 256;
constexpr uint32_t    kDefaultWorkers         = 1;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

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

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
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

forge::runtime::config::RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  forge::runtime::config::RuntimeConfig config;

  // An empty document is a valid all-defaults config.
  if (!yaml.IsNull()) {
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
  }

  ConfigLoader::ApplyDefaults(config);
  return config;
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

forge::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  return FromYamlNode(yaml);
}

forge::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  return FromYamlNode(yaml);
}

void ConfigLoader::ApplyDefaults(forge::runtime::config::RuntimeConfig& config) {
  using namespace forge::runtime::config;

  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address(kDefaultBindAddress);
  }

  auto* database = config.mutable_database();
  if (database->backend_case() == DatabaseConfig::BACKEND_NOT_SET) {
    database->mutable_sqlite()->set_path(kDefaultSqlitePath);
  } else if (database->has_sqlite() && database->sqlite().path().empty()) {
    database->mutable_sqlite()->set_path(kDefaultSqlitePath);
  }

  auto* status = config.mutable_status();
  if (status->directory().empty()) {
    status->set_directory(kDefaultStatusDirectory);
  }
  if (status->query_backend() == STATUS_QUERY_BACKEND_UNSPECIFIED) {
    status->set_query_backend(STATUS_QUERY_BACKEND_FILE);
  }

  if (config.hub().observer_queue_capacity() == 0) {
    config.mutable_hub()->set_observer_queue_capacity(kDefaultQueueCapacity);
  }

  if (config.runner().workers() == 0) {
    config.mutable_runner()->set_workers(kDefaultWorkers);
  }

  if (config.logging().level().empty()) {
    config.mutable_logging()->set_level("info");
  }

  if (config.observability().transport() == OTLP_TRANSPORT_UNSPECIFIED) {
    config.mutable_observability()->set_transport(OTLP_TRANSPORT_GRPC);
  }
}

} // namespace forge::config
