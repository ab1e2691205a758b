#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace usagestat::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars carry the non-specific "!" tag and always stay strings
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

static std::string Lowercase(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

usagestat::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  usagestat::runtime::config::RuntimeConfig config;

  // empty document
  if (yaml.IsNull()) {
    return config;
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

  return config;
}

void ConfigLoader::ApplyDefaults(usagestat::runtime::config::RuntimeConfig& config) {
  auto* storage = config.mutable_storage();
  if (storage->path().empty()) {
    storage->set_path(kDefaultDbPath);
  }
  if (storage->busy_timeout_ms() == 0) {
    storage->set_busy_timeout_ms(kDefaultBusyTimeoutMs);
  }

  auto* audit = config.mutable_audit();
  if (audit->path().empty()) {
    audit->set_path(kDefaultAuditLogPath);
  }
}

void ConfigLoader::ApplyEnvironmentOverrides(usagestat::runtime::config::RuntimeConfig& config) {
  if (const char* db_path = std::getenv("USAGESTAT_DB_PATH")) {
    config.mutable_storage()->set_path(db_path);
  }

  if (const char* log_path = std::getenv("USAGESTAT_LOG_PATH")) {
    config.mutable_audit()->set_path(log_path);
  }

  if (const char* enabled = std::getenv("USAGESTAT_LOG_ENABLED")) {
    const auto value = Lowercase(enabled);
    if (value == "true" || value == "1" || value == "yes") {
      config.mutable_audit()->set_enabled(true);
    } else if (value == "false" || value == "0" || value == "no") {
      config.mutable_audit()->set_enabled(false);
    }
  }
}

usagestat::runtime::config::RuntimeConfig ConfigLoader::Load(const std::string& path) {
  auto config = path.empty() ? usagestat::runtime::config::RuntimeConfig{} : LoadFromYaml(path);
  ApplyDefaults(config);
  ApplyEnvironmentOverrides(config);
  return config;
}

} // namespace usagestat::config
