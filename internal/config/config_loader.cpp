#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace sitestore::config {

using sitestore::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars are always strings ("12345" stays a password, not a number)
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

static const char* FirstEnv(const char* primary, const char* fallback) {
  if (const char* v = std::getenv(primary); v && *v) return v;
  if (const char* v = std::getenv(fallback); v && *v) return v;
  return nullptr;
}

bool IsSafeSchemaName(const std::string& schema) {
  if (schema.empty()) return false;
  for (const char c : schema) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
    if (!ok) return false;
  }
  return true;
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

  RuntimeConfig config;

  // an empty file is a valid all-defaults configuration
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

  ApplyEnvironmentOverrides(config);
  ApplyDefaults(config);
  return config;
}

void ConfigLoader::ApplyEnvironmentOverrides(RuntimeConfig& config) {
  auto* database = config.mutable_database();

  if (const char* url = FirstEnv("SITESTORE_DATABASE_URL", "DATABASE_URL")) {
    if (database->has_postgres() || database->backend_case() == sitestore::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
      database->mutable_postgres()->set_connection_uri(url);
    }
  }

  if (const char* schema = FirstEnv("SITESTORE_DB_SCHEMA", "DB_SCHEMA")) {
    if (database->has_postgres()) {
      database->mutable_postgres()->set_schema(schema);
    }
  }

  if (const char* identifier = FirstEnv("SITESTORE_ADMIN_IDENTIFIER", "ADMIN_EMAIL")) {
    config.mutable_auth()->set_admin_identifier(identifier);
  }

  if (const char* password = FirstEnv("SITESTORE_ADMIN_PASSWORD", "ADMIN_PASSWORD")) {
    config.mutable_auth()->set_admin_password(password);
  }
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* auth = config.mutable_auth();
  if (auth->pbkdf2_iterations() == 0) {
    auth->set_pbkdf2_iterations(kDefaultPbkdf2Iterations);
  }
  if (auth->pbkdf2_iterations() < kMinPbkdf2Iterations) {
    throw std::runtime_error("Invalid configuration: auth.pbkdf2_iterations must be at least " + std::to_string(kMinPbkdf2Iterations));
  }
  if (auth->session_ttl_ms() == 0) {
    auth->set_session_ttl_ms(kDefaultSessionTtlMs);
  }
  if (auth->session_ttl_ms() > kMaxSessionTtlMs) {
    throw std::runtime_error("Invalid configuration: auth.session_ttl_ms must be at most " + std::to_string(kMaxSessionTtlMs));
  }

  if (config.storage().owner_id().empty()) {
    config.mutable_storage()->set_owner_id(kDefaultOwnerId);
  }

  auto* database = config.mutable_database();
  if (database->backend_case() == sitestore::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    database->mutable_memory();
  }

  if (database->has_sqlite() && database->sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }

  if (database->has_postgres()) {
    auto* pg = database->mutable_postgres();
    if (pg->connection_uri().empty()) {
      throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
    }
    // unsafe names fall back to public rather than failing startup
    if (!IsSafeSchemaName(pg->schema())) {
      pg->set_schema(kDefaultPgSchema);
    }
    if (pg->max_connections() == 0) {
      pg->set_max_connections(kDefaultMaxConnections);
    }
    if (pg->acquire_timeout_ms() == 0) {
      pg->set_acquire_timeout_ms(kDefaultAcquireTimeoutMs);
    }
  }
}

} // namespace sitestore::config
