/**
 * @file config.cpp
 * @brief Configuration loader implementation
 */

#include "config/config.h"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <fstream>
#include <nlohmann/json-schema.hpp>
#include <nlohmann/json.hpp>
#include <sstream>

#include "config_schema_embedded.h"  // Generated from config_schema.json
#include "mysql/dsn.h"
#include "utils/string_utils.h"

namespace binlogsync::config {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

using json = nlohmann::json;
using nlohmann::json_schema::json_validator;

constexpr int kMaxPoolSize = 256;

/**
 * @brief Convert YAML node to JSON recursively
 *
 * Plain scalars that read as JSON (numbers, booleans) keep that type;
 * quoted scalars always stay strings.
 */
json YamlToJson(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      return {};
    case YAML::NodeType::Scalar: {
      const std::string& text = node.Scalar();
      if (node.Tag() == "!") {
        return text;
      }
      json parsed = json::parse(text, nullptr, false);
      if (parsed.is_discarded() || parsed.is_object() || parsed.is_array()) {
        return text;
      }
      return parsed;
    }
    case YAML::NodeType::Sequence: {
      json result = json::array();
      for (const auto& item : node) {
        result.push_back(YamlToJson(item));
      }
      return result;
    }
    case YAML::NodeType::Map: {
      json result = json::object();
      for (const auto& key_value : node) {
        result[key_value.first.as<std::string>()] = YamlToJson(key_value.second);
      }
      return result;
    }
    default:
      return {};
  }
}

template <typename T>
void ReadOptional(const json& obj, const char* key, T& out) {
  if (obj.contains(key) && !obj[key].is_null()) {
    out = obj[key].get<T>();
  }
}

utils::Expected<Config, utils::Error> ParseConfigFromJson(const json& root) {
  Config config;
  try {
    if (root.contains("mysql")) {
      const auto& mysql_json = root["mysql"];
      ReadOptional(mysql_json, "dsn", config.mysql.dsn);
      ReadOptional(mysql_json, "pool_size", config.mysql.pool_size);
      ReadOptional(mysql_json, "heartbeat_period_ms", config.mysql.heartbeat_period_ms);
    }
    if (root.contains("replication")) {
      const auto& replication = root["replication"];
      ReadOptional(replication, "resume_from_state", config.replication.resume_from_state);
      ReadOptional(replication, "check_row_image", config.replication.check_row_image);
      ReadOptional(replication, "include_schema_only", config.replication.include_schema_only);
      ReadOptional(replication, "save_interval_ms", config.replication.save_interval_ms);
    }
    if (root.contains("state")) {
      ReadOptional(root["state"], "dir", config.state.dir);
    }
    if (root.contains("output")) {
      ReadOptional(root["output"], "file", config.output.file);
    }
    if (root.contains("logging")) {
      const auto& logging = root["logging"];
      ReadOptional(logging, "level", config.logging.level);
      ReadOptional(logging, "format", config.logging.format);
      ReadOptional(logging, "file", config.logging.file);
    }
  } catch (const json::exception& e) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigInvalidValue, std::string("Invalid value type: ") + e.what()));
  }

  if (config.mysql.dsn.empty()) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigMissingRequired, "mysql.dsn is required"));
  }
  auto dsn = mysql::Dsn::Parse(config.mysql.dsn);
  if (!dsn) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigInvalidValue, "mysql.dsn: " + dsn.error().message()));
  }
  if (config.mysql.pool_size < 1 || config.mysql.pool_size > kMaxPoolSize) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigInvalidValue, "mysql.pool_size must be in [1, 256]"));
  }
  if (config.mysql.heartbeat_period_ms < 0 || config.replication.save_interval_ms < 0) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigInvalidValue, "durations must not be negative"));
  }
  config.replication.check_row_image = utils::ToUpper(config.replication.check_row_image);
  return config;
}

utils::Expected<std::string, utils::Error> ReadFileToString(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigFileNotFound, "Failed to open configuration file", path));
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  std::string content = buffer.str();
  if (content.empty()) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigParseError, "Configuration file is empty", path));
  }
  return content;
}

/**
 * @brief Parse YAML (a superset of JSON) into a JSON document
 */
utils::Expected<json, utils::Error> ParseDocument(const std::string& text) {
  try {
    YAML::Node root = YAML::Load(text);
    if (!root.IsMap()) {
      return MakeUnexpected(MakeError(ErrorCode::kConfigParseError, "Configuration root must be a mapping"));
    }
    return YamlToJson(root);
  } catch (const YAML::Exception& e) {
    std::string message = std::string("YAML parse error: ") + e.what();
    if (e.mark.line != static_cast<size_t>(-1)) {
      message += " (line " + std::to_string(e.mark.line + 1) + ", column " + std::to_string(e.mark.column + 1) + ")";
    }
    return MakeUnexpected(MakeError(ErrorCode::kConfigYamlError, message));
  }
}

}  // namespace

utils::Expected<void, utils::Error> ValidateConfigJson(const std::string& config_json_str,
                                                       const std::string& schema_json_str) {
  json config_json;
  json schema_json;
  try {
    config_json = json::parse(config_json_str);
  } catch (const json::parse_error& e) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigJsonError, std::string("JSON parse error: ") + e.what()));
  }
  try {
    schema_json = json::parse(schema_json_str.empty() ? std::string(kConfigSchemaJson) : schema_json_str);
  } catch (const json::parse_error& e) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigSchemaError, std::string("Schema parse error: ") + e.what()));
  }

  json_validator validator;
  try {
    validator.set_root_schema(schema_json);
  } catch (const std::exception& e) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigSchemaError, std::string("Invalid schema: ") + e.what()));
  }
  try {
    validator.validate(config_json);
  } catch (const std::exception& e) {
    return MakeUnexpected(
        MakeError(ErrorCode::kConfigValidationError, std::string("Configuration validation failed: ") + e.what()));
  }
  spdlog::debug("Configuration validation passed");
  return {};
}

utils::Expected<Config, utils::Error> LoadConfigFromString(const std::string& text,
                                                           const std::string& schema_json_str) {
  auto document = ParseDocument(text);
  if (!document) {
    return MakeUnexpected(document.error());
  }
  auto valid = ValidateConfigJson(document->dump(), schema_json_str);
  if (!valid) {
    return MakeUnexpected(valid.error());
  }
  return ParseConfigFromJson(*document);
}

utils::Expected<Config, utils::Error> LoadConfig(const std::string& path, const std::string& schema_path) {
  auto content = ReadFileToString(path);
  if (!content) {
    return MakeUnexpected(content.error());
  }
  std::string schema_str;
  if (!schema_path.empty()) {
    auto schema = ReadFileToString(schema_path);
    if (!schema) {
      return MakeUnexpected(MakeError(ErrorCode::kConfigSchemaError, schema.error().message(), schema_path));
    }
    schema_str = std::move(*schema);
  }

  auto config = LoadConfigFromString(*content, schema_str);
  if (!config) {
    const auto& err = config.error();
    return MakeUnexpected(MakeError(err.code(), err.message(), err.context().empty() ? path : err.context()));
  }
  spdlog::debug("Configuration loaded from {}", path);
  return config;
}

}  // namespace binlogsync::config
