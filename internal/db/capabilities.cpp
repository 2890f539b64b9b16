#include "capabilities.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace sitestore::db {

SchemaCapabilities NegotiateCapabilities(KvRepository& repository) {
  try {
    const auto caps = repository.DetectCapabilities();
    SITESTORE_LOG_INFO("schema capabilities negotiated", {observability::BoolField("kv_owner_column", caps.kv_owner_column),
                                                          observability::BoolField("audit_owner_column", caps.audit_owner_column)});
    return caps;
  } catch (const std::exception& e) {
    SITESTORE_LOG_WARN("capability probe failed; assuming unscoped schema", {observability::StringField("error", e.what())});
    return {};
  }
}

} // namespace sitestore::db
