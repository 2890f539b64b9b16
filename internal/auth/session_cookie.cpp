#include "session_cookie.hpp"

namespace sitestore::auth {

namespace {

std::string_view Trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
  return s;
}

} // namespace

std::string BuildSessionCookie(const std::string& token, std::chrono::milliseconds ttl) {
  const auto max_age = std::chrono::duration_cast<std::chrono::seconds>(ttl).count();
  return std::string(kSessionCookieName) + "=" + token + "; Path=/; HttpOnly; SameSite=Lax; Max-Age=" +
         std::to_string(max_age < 0 ? 0 : max_age);
}

std::string BuildClearedSessionCookie() {
  return std::string(kSessionCookieName) +
         "=; Path=/; HttpOnly; SameSite=Lax; Max-Age=0; Expires=Thu, 01 Jan 1970 00:00:00 GMT";
}

std::optional<std::string> ExtractCookie(std::string_view header, std::string_view name) {
  while (!header.empty()) {
    const auto semi = header.find(';');
    auto       pair = Trim(header.substr(0, semi));
    header          = semi == std::string_view::npos ? std::string_view{} : header.substr(semi + 1);

    const auto eq = pair.find('=');
    if (eq == std::string_view::npos) continue;
    if (Trim(pair.substr(0, eq)) != name) continue;

    auto value = Trim(pair.substr(eq + 1));
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
      value = value.substr(1, value.size() - 2);
    }
    return std::string(value);
  }
  return std::nullopt;
}

} // namespace sitestore::auth
