#include "internal/auth/auth_service.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <vector>

#include "internal/audit/repository_event_log.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using sitestore::db::memory::MemoryKvRepository;

struct Fixture {
  explicit Fixture(std::shared_ptr<MemoryKvRepository> repo = std::make_shared<MemoryKvRepository>())
      : repository(std::move(repo)) {
    auto clock_fn = [this] { return now; };
    store         = std::make_shared<sitestore::kv::KvStore>(repository, sitestore::service::StoreContext{});
    credentials   = std::make_shared<sitestore::auth::CredentialManager>(store, sitestore::config::kMinPbkdf2Iterations, clock_fn);
    tokens        = std::make_shared<sitestore::auth::SessionTokenService>(store, clock_fn);
    events        = std::make_shared<sitestore::audit::RepositoryEventLog>(repository, sitestore::service::StoreContext{});
    auth          = std::make_shared<sitestore::auth::AuthService>(credentials, tokens, events, "a@x.com", 1000ms);
  }

  std::vector<std::string> Events() const {
    std::vector<std::string> names;
    for (const auto& entry : repository->AuditTrail()) names.push_back(entry.record.event);
    return names;
  }

  sitestore::util::TimePoint now = sitestore::util::TimePoint(std::chrono::milliseconds(1'700'000'000'000));

  std::shared_ptr<MemoryKvRepository>                   repository;
  std::shared_ptr<sitestore::kv::KvStore>               store;
  std::shared_ptr<sitestore::auth::CredentialManager>   credentials;
  std::shared_ptr<sitestore::auth::SessionTokenService> tokens;
  std::shared_ptr<sitestore::audit::EventSink>          events;
  std::shared_ptr<sitestore::auth::AuthService>         auth;
};

// Backend that loses its connection for every read.
class UnreachableRepository final : public MemoryKvRepository {
public:
  std::optional<sitestore::db::model::KvRecord> Find(const sitestore::db::OwnerScope&, const std::string&) override {
    throw sitestore::util::BackendUnavailable("connection refused");
  }
};

void TestLoginScenario() {
  Fixture f;
  f.credentials->EnsurePrincipal("a@x.com", "pw123");

  const auto token = f.auth->Login("a@x.com", "pw123");
  assert(token);

  const auto claims = f.auth->Authenticate(*token);
  assert(claims && claims->sub == "a@x.com");
  assert(claims->exp_ms - claims->iat_ms == 1000);

  f.now += 999ms;
  assert(f.auth->Authenticate(*token));

  f.now += 1ms;
  assert(!f.auth->Authenticate(*token));

  assert((f.Events() == std::vector<std::string>{"login_success"}));
}

void TestLoginFailuresAreUniform() {
  Fixture f;
  f.credentials->EnsurePrincipal("a@x.com", "pw123");

  assert(!f.auth->Login("a@x.com", "wrong"));
  assert(!f.auth->Login("b@x.com", "pw123"));
  assert((f.Events() == std::vector<std::string>{"login_failed", "login_failed"}));

  // the password never reaches the audit trail
  for (const auto& entry : f.repository->AuditTrail()) {
    assert(entry.record.details_json.find("wrong") == std::string::npos);
  }
}

void TestTokenForOtherSubjectIsRejected() {
  Fixture f;
  const auto token = f.tokens->Issue("someone-else@x.com", 1h);
  assert(f.tokens->Verify(token));
  assert(!f.auth->Authenticate(token));
}

void TestLogoutRecordsOnlyValidSessions() {
  Fixture f;
  f.credentials->EnsurePrincipal("a@x.com", "pw123");
  const auto token = f.auth->Login("a@x.com", "pw123");

  f.auth->Logout("garbage");
  f.auth->Logout(*token);
  assert((f.Events() == std::vector<std::string>{"login_success", "logout"}));
}

void TestBackendFaultsPropagate() {
  Fixture f(std::make_shared<UnreachableRepository>());

  bool threw = false;
  try {
    (void)f.auth->Login("a@x.com", "pw123");
  } catch (const sitestore::util::BackendUnavailable&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestLoginScenario();
  TestLoginFailuresAreUniform();
  TestTokenForOtherSubjectIsRejected();
  TestLogoutRecordsOnlyValidSessions();
  TestBackendFaultsPropagate();

  std::cout << "sitestore_unit_auth_service: pass\n";
  return 0;
}
