#pragma once

#include <string>

namespace sitestore::db::sql {

/*
  LIKE pattern for a literal prefix.

  '%', '_' and '\' in the caller's prefix are escaped with '\', so the
  pattern must be used with ESCAPE '\'. The result is always bound as a
  parameter, never spliced into SQL text.
*/
std::string LikePrefixPattern(const std::string& prefix);

} // namespace sitestore::db::sql
