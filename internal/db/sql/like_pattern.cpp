#include "like_pattern.hpp"

namespace sitestore::db::sql {

std::string LikePrefixPattern(const std::string& prefix) {
  std::string pattern;
  pattern.reserve(prefix.size() + 2);
  for (const char c : prefix) {
    if (c == '%' || c == '_' || c == '\\') {
      pattern.push_back('\\');
    }
    pattern.push_back(c);
  }
  pattern.push_back('%');
  return pattern;
}

} // namespace sitestore::db::sql
