#include "auth_service.hpp"

#include "internal/observability/logging.hpp"

namespace sitestore::auth {

AuthService::AuthService(std::shared_ptr<CredentialManager> credentials,
                         std::shared_ptr<SessionTokenService> tokens,
                         std::shared_ptr<audit::EventSink> events,
                         std::string admin_identifier,
                         std::chrono::milliseconds session_ttl)
    : credentials_(std::move(credentials)),
      tokens_(std::move(tokens)),
      events_(std::move(events)),
      admin_identifier_(std::move(admin_identifier)),
      session_ttl_(session_ttl) {
}

std::optional<std::string> AuthService::Login(const std::string& identifier, const std::string& password) {
  if (!credentials_->VerifyPassword(identifier, password)) {
    events_->Record("login_failed", kv::MakeObject({{"identifier", kv::MakeString(identifier)}}));
    SITESTORE_LOG_INFO("login rejected", {observability::StringField("identifier", identifier)});
    return std::nullopt;
  }

  auto token = tokens_->Issue(identifier, session_ttl_);
  events_->Record("login_success", kv::MakeObject({{"identifier", kv::MakeString(identifier)}}));
  return token;
}

std::optional<SessionClaims> AuthService::Authenticate(const std::string& token) {
  auto claims = tokens_->Verify(token);
  if (!claims || claims->sub != admin_identifier_) return std::nullopt;
  return claims;
}

void AuthService::Logout(const std::string& token) {
  if (auto claims = Authenticate(token)) {
    events_->Record("logout", kv::MakeObject({{"identifier", kv::MakeString(claims->sub)}}));
  }
}

} // namespace sitestore::auth
