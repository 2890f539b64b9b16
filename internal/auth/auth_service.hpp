#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "internal/audit/event_sink.hpp"
#include "internal/auth/credential_manager.hpp"
#include "internal/auth/session_tokens.hpp"

namespace sitestore::auth {

/*
  AuthService

  Login / authenticate / logout for the single administrative principal.

  Every rejection is a bare nullopt so callers cannot tell a wrong password
  from an unknown identifier or a forged token. Backend faults propagate.
*/
class AuthService {
public:
  AuthService(std::shared_ptr<CredentialManager> credentials,
              std::shared_ptr<SessionTokenService> tokens,
              std::shared_ptr<audit::EventSink> events,
              std::string admin_identifier,
              std::chrono::milliseconds session_ttl);

  // Session token on success; records login_success / login_failed.
  std::optional<std::string> Login(const std::string& identifier, const std::string& password);

  std::optional<SessionClaims> Authenticate(const std::string& token);

  // Records logout for a valid token. Invalid tokens are ignored.
  void Logout(const std::string& token);

  std::chrono::milliseconds SessionTtl() const {
    return session_ttl_;
  }

private:
  std::shared_ptr<CredentialManager>   credentials_;
  std::shared_ptr<SessionTokenService> tokens_;
  std::shared_ptr<audit::EventSink>    events_;
  std::string                          admin_identifier_;
  std::chrono::milliseconds            session_ttl_;
};

} // namespace sitestore::auth
