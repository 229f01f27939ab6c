#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace flowsched::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  if (!scalar_value.empty()) {
    char*        endptr        = nullptr;
    const double numeric_value = strtod(scalar_value.c_str(), &endptr);
    if (endptr && *endptr == '\0') {
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
      throw util::ConfigurationError("Unsupported YAML node");
  }
}

static flowsched::runtime::config::RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  flowsched::runtime::config::RuntimeConfig config;

  // an empty document is an all-defaults config
  if (yaml.IsNull()) {
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw util::ConfigurationError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw util::ConfigurationError("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::Validate(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

flowsched::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::ConfigurationError("Failed to load YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

flowsched::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw util::ConfigurationError("Failed to parse YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

void ConfigLoader::Validate(const flowsched::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite() && database.sqlite().path().empty()) {
    throw util::ConfigurationError("database.sqlite.path must not be empty");
  }
  if (database.has_postgres() && database.postgres().connection_uri().empty()) {
    throw util::ConfigurationError("database.postgres.connection_uri must not be empty");
  }

  const auto& scheduler = config.scheduler();
  if (scheduler.has_loop_interval() && (scheduler.loop_interval().seconds() < 0 || scheduler.loop_interval().nanos() < 0)) {
    throw util::ConfigurationError("scheduler.loop_interval must not be negative");
  }
  if (scheduler.has_horizon() && (scheduler.horizon().seconds() < 0 || scheduler.horizon().nanos() < 0)) {
    throw util::ConfigurationError("scheduler.horizon must not be negative");
  }
}

} // namespace flowsched::config
