#pragma once

#include <cstdint>
#include <string>

#include "config/config.pb.h"

namespace sitestore::config {

inline constexpr uint32_t kMinPbkdf2Iterations     = 100000;
inline constexpr uint32_t kDefaultPbkdf2Iterations = 150000;
inline constexpr uint64_t kDefaultSessionTtlMs     = 24ull * 60 * 60 * 1000;
inline constexpr uint64_t kMaxSessionTtlMs         = 365ull * 24 * 60 * 60 * 1000;
inline constexpr uint32_t kDefaultMaxConnections   = 16;
inline constexpr uint32_t kDefaultAcquireTimeoutMs = 5000;
inline constexpr const char* kDefaultOwnerId       = "default";
inline constexpr const char* kDefaultPgSchema      = "public";

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  LoadFromYaml applies environment overrides and defaults before returning.
*/
class ConfigLoader {
 public:
  static sitestore::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // DATABASE_URL / DB_SCHEMA / ADMIN_EMAIL / ADMIN_PASSWORD and their SITESTORE_ prefixed forms.
  // DATABASE_URL selects Postgres only when the file names no backend or names postgres;
  // an explicit memory or sqlite backend is kept.
  static void ApplyEnvironmentOverrides(sitestore::runtime::config::RuntimeConfig& config);

  // Fills unset fields and rejects values below the security floor or a session ttl above kMaxSessionTtlMs.
  static void ApplyDefaults(sitestore::runtime::config::RuntimeConfig& config);
};

// Postgres schema names are spliced into search_path; only [A-Za-z0-9_]+ is accepted.
bool IsSafeSchemaName(const std::string& schema);

} // namespace sitestore::config
