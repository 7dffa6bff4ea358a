#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace eventlog::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("250" is not a number)
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

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

eventlog::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  eventlog::runtime::config::RuntimeConfig config;

  // an empty document is a valid "all defaults" config
  if (!yaml.IsNull()) {
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

  ApplyDefaults(config);
  return config;
}

void ConfigLoader::ApplyDefaults(eventlog::runtime::config::RuntimeConfig& config) {
  auto* watcher = config.mutable_watcher();
  if (watcher->channel().empty()) {
    watcher->set_channel(kDefaultChannel);
  }
  if (watcher->poll_interval_ms() == 0) {
    watcher->set_poll_interval_ms(kDefaultPollIntervalMs);
  }

  auto* reconnect = watcher->mutable_reconnect();
  if (reconnect->initial_backoff_ms() == 0) {
    reconnect->set_initial_backoff_ms(kDefaultInitialBackoffMs);
  }
  if (reconnect->max_backoff_ms() == 0) {
    reconnect->set_max_backoff_ms(kDefaultMaxBackoffMs);
  }
  if (reconnect->max_backoff_ms() < reconnect->initial_backoff_ms()) {
    throw std::runtime_error("Invalid configuration: watcher.reconnect.max_backoff_ms is below initial_backoff_ms");
  }

  if (config.database().has_postgres()) {
    auto* postgres = config.mutable_database()->mutable_postgres();
    if (postgres->connection_uri().empty()) {
      throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
    }
    if (postgres->max_connections() == 0) {
      postgres->set_max_connections(kDefaultPgMaxConnections);
    }
  }

  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
}

eventlog::runtime::config::RuntimeConfig ConfigLoader::Defaults() {
  eventlog::runtime::config::RuntimeConfig config;
  ApplyDefaults(config);
  return config;
}

} // namespace eventlog::config
