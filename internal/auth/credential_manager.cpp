#include "credential_manager.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

#include "internal/auth/crypto.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/encoding.hpp"

namespace sitestore::auth {

namespace {

constexpr std::size_t kSaltBytes = 16;

// Iteration counts read back from storage are trusted only within this range.
constexpr double kMaxStoredIterations = 10'000'000;

} // namespace

const char* ToString(EnsureOutcome outcome) {
  switch (outcome) {
    case EnsureOutcome::kCreated:
      return "created";
    case EnsureOutcome::kAlreadyPresent:
      return "already_present";
    case EnsureOutcome::kReplaced:
      return "replaced";
  }
  return "unknown";
}

CredentialManager::CredentialManager(std::shared_ptr<kv::KvStore> store, uint32_t iterations, util::ClockFn clock)
    : store_(std::move(store)), iterations_(iterations), clock_(std::move(clock)) {
  if (iterations_ < config::kMinPbkdf2Iterations) {
    throw std::invalid_argument("pbkdf2 iterations below minimum of " + std::to_string(config::kMinPbkdf2Iterations));
  }
}

EnsureOutcome CredentialManager::EnsurePrincipal(const std::string& identifier, const std::string& password) {
  const auto existing = store_->Get(kPrincipalKey);
  if (existing && kv::GetString(*existing, "email") == identifier) {
    return EnsureOutcome::kAlreadyPresent;
  }

  const auto salt = util::HexEncode(RandomBytes(kSaltBytes));
  const auto hash = util::HexEncode(Pbkdf2HmacSha256(password, salt, iterations_));

  store_->Put(kPrincipalKey, kv::MakeObject({
                                 {"email", kv::MakeString(identifier)},
                                 {"algo", kv::MakeString(kPasswordAlgo)},
                                 {"iterations", kv::MakeNumber(iterations_)},
                                 {"salt", kv::MakeString(salt)},
                                 {"hash", kv::MakeString(hash)},
                                 {"created_at", kv::MakeString(util::ToIso8601(clock_()))},
                             }));

  if (existing) {
    SITESTORE_LOG_WARN("administrative principal replaced", {observability::StringField("identifier", identifier)});
    return EnsureOutcome::kReplaced;
  }

  SITESTORE_LOG_INFO("administrative principal created", {observability::StringField("identifier", identifier)});
  return EnsureOutcome::kCreated;
}

bool CredentialManager::VerifyPassword(const std::string& identifier, const std::string& password) const {
  const auto record = store_->Get(kPrincipalKey);
  if (!record || kv::GetString(*record, "email") != identifier) return false;

  const auto algo       = kv::GetString(*record, "algo");
  const auto iterations = kv::GetNumber(*record, "iterations");
  const auto salt       = kv::GetString(*record, "salt");
  const auto hash_hex   = kv::GetString(*record, "hash");
  if (!salt || !hash_hex || !iterations) return false;
  if (algo && *algo != kPasswordAlgo) return false;
  if (*iterations < 1 || *iterations > kMaxStoredIterations || std::floor(*iterations) != *iterations) return false;

  const auto expected = util::HexDecode(*hash_hex);
  if (!expected || expected->size() != kSha256Bytes) return false;

  const auto derived = Pbkdf2HmacSha256(password, *salt, static_cast<uint32_t>(*iterations));
  return ConstantTimeEquals(derived, *expected);
}

} // namespace sitestore::auth
