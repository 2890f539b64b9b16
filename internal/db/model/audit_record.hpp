#pragma once

#include <string>

namespace sitestore::db::model {

struct AuditRecord {
  std::string event;

  // JSON object text
  std::string details_json = "{}";
};

} // namespace sitestore::db::model
