#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/kv/kv_store.hpp"
#include "internal/util/time.hpp"

namespace sitestore::auth {

inline constexpr const char* kSessionSecretKey = "admin:session_secret";
inline constexpr int         kTokenVersion     = 1;

// Longest accepted session lifetime (one year).
inline constexpr std::chrono::milliseconds kMaxTokenTtl{365LL * 24 * 60 * 60 * 1000};

struct SessionClaims {
  std::string sub;
  int64_t     iat_ms = 0;
  int64_t     exp_ms = 0;
  int         ver    = kTokenVersion;
};

/*
  SessionTokenService

  Compact HS256 tokens:

    b64url(header) "." b64url(claims) "." b64url(HMAC-SHA256(secret, b64url(header) "." b64url(claims)))

  header is {"alg":"HS256","typ":"JWT"}; claims are {sub, iat, exp, ver}
  with iat/exp in Unix epoch milliseconds.

  The signing secret lives at kSessionSecretKey (32 random bytes, hex) and
  is created on first use. It is read from the store on every Issue/Verify,
  so a rotation by any process invalidates every outstanding token at once.

  Thread-safe. Backend failures propagate; malformed, forged or expired
  tokens verify as nullopt.
*/
class SessionTokenService {
public:
  explicit SessionTokenService(std::shared_ptr<kv::KvStore> store, util::ClockFn clock = util::Now);

  // Raw secret bytes. Concurrent cold starts converge on one stored secret.
  std::string GetOrCreateSecret();

  // Throws std::invalid_argument unless 0 < ttl <= kMaxTokenTtl.
  std::string Issue(const std::string& sub, std::chrono::milliseconds ttl);

  std::optional<SessionClaims> Verify(const std::string& token);

  // Overwrites the stored secret.
  void RotateSecret();

private:
  std::shared_ptr<kv::KvStore> store_;
  util::ClockFn                clock_;
};

} // namespace sitestore::auth
