#pragma once

#include <cstdint>
#include <string>

namespace sitestore::db::model {

/*
  Stored as JSON text for portability:
    postgres -> jsonb
    sqlite   -> text
    memory   -> string
*/

struct KvRecord {
  std::string key;

  // serialized value
  std::string json;

  // maintained by the backend on every write (epoch ms); ignored on write
  int64_t updated_at_ms = 0;
};

} // namespace sitestore::db::model
