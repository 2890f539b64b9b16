#include "internal/auth/credential_manager.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"

namespace {

using sitestore::auth::CredentialManager;
using sitestore::auth::EnsureOutcome;

constexpr uint32_t kIterations = sitestore::config::kMinPbkdf2Iterations;

std::shared_ptr<sitestore::kv::KvStore> NewStore() {
  return std::make_shared<sitestore::kv::KvStore>(std::make_shared<sitestore::db::memory::MemoryKvRepository>(),
                                                  sitestore::service::StoreContext{});
}

void TestEnsureIsIdempotent() {
  auto              store = NewStore();
  CredentialManager credentials(store, kIterations);

  assert(credentials.EnsurePrincipal("a@x.com", "pw123") == EnsureOutcome::kCreated);
  const auto first = store->Get(sitestore::auth::kPrincipalKey);
  assert(credentials.VerifyPassword("a@x.com", "pw123"));

  assert(credentials.EnsurePrincipal("a@x.com", "pw123") == EnsureOutcome::kAlreadyPresent);
  const auto second = store->Get(sitestore::auth::kPrincipalKey);
  assert(sitestore::kv::Equals(*first, *second));
  assert(credentials.VerifyPassword("a@x.com", "pw123"));

  assert(store->ListKeysWithPrefix("admin:user").size() == 1);
}

void TestRecordShape() {
  auto              store = NewStore();
  CredentialManager credentials(store, kIterations);
  credentials.EnsurePrincipal("a@x.com", "pw123");

  const auto record = store->Get(sitestore::auth::kPrincipalKey);
  assert(record);
  assert(sitestore::kv::GetString(*record, "email") == "a@x.com");
  assert(sitestore::kv::GetString(*record, "algo") == "pbkdf2_sha256");
  assert(sitestore::kv::GetNumber(*record, "iterations") == static_cast<double>(kIterations));
  assert(sitestore::kv::GetString(*record, "salt")->size() == 32);
  assert(sitestore::kv::GetString(*record, "hash")->size() == 64);
  assert(sitestore::kv::GetString(*record, "created_at")->back() == 'Z');
}

void TestRejections() {
  auto              store = NewStore();
  CredentialManager credentials(store, kIterations);

  assert(!credentials.VerifyPassword("a@x.com", "pw123")); // no record yet

  credentials.EnsurePrincipal("a@x.com", "pw123");
  assert(!credentials.VerifyPassword("a@x.com", "wrong"));
  assert(!credentials.VerifyPassword("b@x.com", "pw123"));
  assert(!credentials.VerifyPassword("A@X.COM", "pw123"));
}

void TestOtherIdentifierIsReplaced() {
  auto              store = NewStore();
  CredentialManager credentials(store, kIterations);

  credentials.EnsurePrincipal("old@x.com", "old-pw");
  assert(credentials.EnsurePrincipal("new@x.com", "new-pw") == EnsureOutcome::kReplaced);

  assert(credentials.VerifyPassword("new@x.com", "new-pw"));
  assert(!credentials.VerifyPassword("old@x.com", "old-pw"));
}

void TestMalformedRecordVerifiesFalse() {
  auto              store = NewStore();
  CredentialManager credentials(store, kIterations);

  store->Put(sitestore::auth::kPrincipalKey, sitestore::kv::MakeObject({
                                                 {"email", sitestore::kv::MakeString("a@x.com")},
                                                 {"iterations", sitestore::kv::MakeString("many")},
                                                 {"salt", sitestore::kv::MakeString("00")},
                                                 {"hash", sitestore::kv::MakeString("zz")},
                                             }));
  assert(!credentials.VerifyPassword("a@x.com", "pw123"));

  // a malformed record is treated as a different principal and rewritten
  assert(credentials.EnsurePrincipal("b@x.com", "pw") == EnsureOutcome::kReplaced);
  assert(credentials.VerifyPassword("b@x.com", "pw"));
}

void TestIterationFloor() {
  bool threw = false;
  try {
    CredentialManager credentials(NewStore(), kIterations - 1);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestEnsureIsIdempotent();
  TestRecordShape();
  TestRejections();
  TestOtherIdentifierIsReplaced();
  TestMalformedRecordVerifiesFalse();
  TestIterationFloor();

  std::cout << "sitestore_unit_credential_manager: pass\n";
  return 0;
}
