#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace sitestore::auth {

inline constexpr const char* kSessionCookieName = "auth";

// Set-Cookie value issued on login: HttpOnly, SameSite=Lax, Path=/, Max-Age in whole seconds.
std::string BuildSessionCookie(const std::string& token, std::chrono::milliseconds ttl);

// Set-Cookie value that clears the session on logout.
std::string BuildClearedSessionCookie();

// Value of cookie `name` in a Cookie request header, if present.
std::optional<std::string> ExtractCookie(std::string_view header, std::string_view name);

} // namespace sitestore::auth
