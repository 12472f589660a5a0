#include "config_loader.hpp"

#include <google/protobuf/descriptor.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cmath>
#include <cstdlib>
#include <stdexcept>

#include "internal/util/hex.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace aggregator::config {

// field is the target config field when known; nullptr for the document root
// and for keys the schema does not name (those are rejected by the JSON parser).
static void YamlToProtoValue(const YAML::Node& node, const google::protobuf::Descriptor* message, const google::protobuf::FieldDescriptor* field,
                             google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, const google::protobuf::FieldDescriptor* field, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // string fields take the scalar verbatim, so "1001", "nan" or "inf" are not numbers
  if (field && field->cpp_type() == google::protobuf::FieldDescriptor::CPPTYPE_STRING) {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  // strtod would accept hex, keep keys and addresses textual
  const bool hex_like = scalar_value.size() > 1 && scalar_value[0] == '0' && (scalar_value[1] == 'x' || scalar_value[1] == 'X');
  if (!scalar_value.empty() && !hex_like) {
    char*        endptr        = nullptr;
    const double numeric_value = strtod(scalar_value.c_str(), &endptr);
    if (endptr && *endptr == '\0' && std::isfinite(numeric_value)) {
      value->set_number_value(numeric_value);
      return;
    }
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, const google::protobuf::Descriptor* message, const google::protobuf::FieldDescriptor* field,
                             google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, field, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], message, field, list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      const google::protobuf::Descriptor* nested = message;
      if (field) {
        nested = field->cpp_type() == google::protobuf::FieldDescriptor::CPPTYPE_MESSAGE ? field->message_type() : nullptr;
      }

      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        const std::string                         key   = it.first.Scalar();
        const google::protobuf::FieldDescriptor* child = nullptr;
        if (nested) {
          child = nested->FindFieldByName(key);
          if (!child) child = nested->FindFieldByCamelcaseName(key);
        }
        YamlToProtoValue(it.second, child ? child->message_type() : nullptr, child, &(*struct_value->mutable_fields())[key]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static aggregator::runtime::config::RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, aggregator::runtime::config::RuntimeConfig::descriptor(), nullptr, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  aggregator::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::Validate(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

aggregator::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  return ParseYaml(yaml);
}

aggregator::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  return ParseYaml(yaml);
}

void ConfigLoader::Validate(const aggregator::runtime::config::RuntimeConfig& config) {
  try {
    util::ParseDuration(config.cooldowns().submission());
    util::ParseDuration(config.cooldowns().decryption_request());
    util::ParseDuration(config.oracle().delivery_delay());
  } catch (const std::exception& e) {
    throw std::runtime_error("Invalid configuration: " + std::string(e.what()));
  }

  if (!config.oracle().attestation_key_hex().empty()) {
    std::string key;
    try {
      key = util::FromHex(config.oracle().attestation_key_hex());
    } catch (const std::exception& e) {
      throw std::runtime_error("Invalid configuration: oracle.attestation_key_hex: " + std::string(e.what()));
    }
    if (key.empty()) {
      throw std::runtime_error("Invalid configuration: oracle.attestation_key_hex is empty");
    }
  }

  if (!config.instance().id().empty()) {
    try {
      util::FromString(config.instance().id());
    } catch (const std::exception& e) {
      throw std::runtime_error("Invalid configuration: instance.id: " + std::string(e.what()));
    }
  }

  if (config.database().has_sqlite()) {
    if (config.database().sqlite().path().empty()) {
      throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
    }
    // commitments stored by one process must match the ones recomputed after a restart
    if (config.instance().id().empty()) {
      throw std::runtime_error("Invalid configuration: instance.id is required with database.sqlite");
    }
  }
}

} // namespace aggregator::config
