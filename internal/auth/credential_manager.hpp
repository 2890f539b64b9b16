#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/kv/kv_store.hpp"
#include "internal/util/time.hpp"

namespace sitestore::auth {

inline constexpr const char* kPrincipalKey = "admin:user";
inline constexpr const char* kPasswordAlgo = "pbkdf2_sha256";

enum class EnsureOutcome {
  kCreated,        // no record existed
  kAlreadyPresent, // record for this identifier left untouched
  kReplaced        // record for another identifier overwritten
};

const char* ToString(EnsureOutcome outcome);

/*
  CredentialManager

  Owns the single administrative principal stored at kPrincipalKey:

    {email, algo, iterations, salt, hash, created_at}

  salt is 16 random bytes hex-encoded and is fed to PBKDF2 as that hex text;
  hash is the 32-byte PBKDF2-HMAC-SHA256 output hex-encoded.

  Backend failures propagate from the KvStore. Rejected credentials are
  plain false, never exceptions.
*/
class CredentialManager {
public:
  // Throws std::invalid_argument when iterations is below config::kMinPbkdf2Iterations.
  CredentialManager(std::shared_ptr<kv::KvStore> store, uint32_t iterations, util::ClockFn clock = util::Now);

  EnsureOutcome EnsurePrincipal(const std::string& identifier, const std::string& password);

  bool VerifyPassword(const std::string& identifier, const std::string& password) const;

private:
  std::shared_ptr<kv::KvStore> store_;
  uint32_t                     iterations_;
  util::ClockFn                clock_;
};

} // namespace sitestore::auth
