#include "internal/auth/session_tokens.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/auth/crypto.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/encoding.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using sitestore::auth::SessionTokenService;

struct FakeClock {
  sitestore::util::TimePoint now = sitestore::util::TimePoint(std::chrono::milliseconds(1'700'000'000'000));

  sitestore::util::ClockFn Fn() {
    return [this] { return now; };
  }
};

std::shared_ptr<sitestore::kv::KvStore> NewStore() {
  return std::make_shared<sitestore::kv::KvStore>(std::make_shared<sitestore::db::memory::MemoryKvRepository>(),
                                                  sitestore::service::StoreContext{});
}

void TestIssueAndVerify() {
  FakeClock           clock;
  SessionTokenService tokens(NewStore(), clock.Fn());

  const auto token = tokens.Issue("a@x.com", 1000ms);
  assert(token.rfind("eyJhbGciOiJIUzI1NiIsInR5cCI6IkpXVCJ9.", 0) == 0);

  auto claims = tokens.Verify(token);
  assert(claims);
  assert(claims->sub == "a@x.com");
  assert(claims->iat_ms == 1'700'000'000'000);
  assert(claims->exp_ms == 1'700'000'001'000);
  assert(claims->ver == 1);
}

void TestExpiryIsStrict() {
  FakeClock           clock;
  SessionTokenService tokens(NewStore(), clock.Fn());
  const auto          token = tokens.Issue("a@x.com", 1000ms);

  clock.now += 999ms;
  assert(tokens.Verify(token));

  clock.now += 1ms; // now == exp
  assert(!tokens.Verify(token));

  clock.now += 1h;
  assert(!tokens.Verify(token));
}

void TestAlteredSignatureFails() {
  FakeClock           clock;
  SessionTokenService tokens(NewStore(), clock.Fn());
  const auto          token = tokens.Issue("a@x.com", 1h);

  const auto sig_start = token.rfind('.') + 1;
  for (std::size_t i = sig_start; i < token.size(); ++i) {
    auto forged = token;
    forged[i]   = forged[i] == 'A' ? 'B' : 'A';
    assert(!tokens.Verify(forged));
  }
}

void TestAlteredPayloadFails() {
  FakeClock           clock;
  SessionTokenService tokens(NewStore(), clock.Fn());
  const auto          token = tokens.Issue("a@x.com", 1h);

  const auto first_dot  = token.find('.');
  const auto second_dot = token.rfind('.');
  const auto forged_payload =
      sitestore::util::Base64UrlEncode(R"({"sub":"evil@x.com","iat":1700000000000,"exp":1900000000000,"ver":1})");
  const auto forged = token.substr(0, first_dot + 1) + forged_payload + token.substr(second_dot);
  assert(!tokens.Verify(forged));
}

void TestMalformedTokensFail() {
  FakeClock           clock;
  SessionTokenService tokens(NewStore(), clock.Fn());
  const auto          token = tokens.Issue("a@x.com", 1h);

  for (const std::string bad : {std::string{}, std::string("."), std::string(".."), std::string("a.b.c"), std::string("not-a-token"),
                                token + ".extra", token.substr(0, token.rfind('.')), std::string("%%%.%%%.%%%")}) {
    assert(!tokens.Verify(bad));
  }
}

void TestHeaderMustBeHs256() {
  FakeClock           clock;
  SessionTokenService tokens(NewStore(), clock.Fn());

  // correctly signed, but announces another algorithm
  const auto header  = sitestore::util::Base64UrlEncode(R"({"alg":"none","typ":"JWT"})");
  const auto payload = sitestore::util::Base64UrlEncode(R"({"sub":"a@x.com","iat":1700000000000,"exp":1900000000000,"ver":1})");
  const auto input   = header + "." + payload;
  const auto sig     = sitestore::util::Base64UrlEncode(sitestore::auth::HmacSha256(tokens.GetOrCreateSecret(), input));
  assert(!tokens.Verify(input + "." + sig));

  // same claims under the right header verify
  const auto good_header = sitestore::util::Base64UrlEncode(R"({"alg":"HS256","typ":"JWT"})");
  const auto good_input  = good_header + "." + payload;
  const auto good_sig    = sitestore::util::Base64UrlEncode(sitestore::auth::HmacSha256(tokens.GetOrCreateSecret(), good_input));
  assert(tokens.Verify(good_input + "." + good_sig));

  // wrong version
  const auto v2_payload = sitestore::util::Base64UrlEncode(R"({"sub":"a@x.com","iat":1700000000000,"exp":1900000000000,"ver":2})");
  const auto v2_input   = good_header + "." + v2_payload;
  const auto v2_sig     = sitestore::util::Base64UrlEncode(sitestore::auth::HmacSha256(tokens.GetOrCreateSecret(), v2_input));
  assert(!tokens.Verify(v2_input + "." + v2_sig));
}

void TestRotationInvalidatesOldTokens() {
  FakeClock           clock;
  auto                store = NewStore();
  SessionTokenService tokens(store, clock.Fn());

  const auto old_token  = tokens.Issue("a@x.com", 1h);
  const auto old_secret = tokens.GetOrCreateSecret();
  tokens.RotateSecret();

  assert(tokens.GetOrCreateSecret() != old_secret);
  assert(!tokens.Verify(old_token));
  assert(tokens.Verify(tokens.Issue("a@x.com", 1h)));

  // another process reading the store sees the rotated secret
  SessionTokenService other(store, clock.Fn());
  assert(!other.Verify(old_token));
}

void TestRotationByAnotherInstanceReachesRunningService() {
  FakeClock           clock;
  auto                store = NewStore();
  SessionTokenService server(store, clock.Fn());

  const auto old_token = server.Issue("a@x.com", 1h);
  assert(server.Verify(old_token));

  // e.g. sitestorectl rotate-secret against the same database
  SessionTokenService operator_cli(store, clock.Fn());
  operator_cli.RotateSecret();

  assert(!server.Verify(old_token));

  const auto fresh = server.Issue("a@x.com", 1h);
  assert(server.Verify(fresh));
  assert(operator_cli.Verify(fresh));
}

void TestTtlBounds() {
  FakeClock           clock;
  SessionTokenService tokens(NewStore(), clock.Fn());

  for (const auto ttl : {std::chrono::milliseconds(0), std::chrono::milliseconds(-1), sitestore::auth::kMaxTokenTtl + 1ms,
                         std::chrono::milliseconds(9'000'000'000'000'000), std::chrono::milliseconds::max()}) {
    bool threw = false;
    try {
      (void)tokens.Issue("a@x.com", ttl);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
  }

  const auto longest = tokens.Issue("a@x.com", sitestore::auth::kMaxTokenTtl);
  auto       claims  = tokens.Verify(longest);
  assert(claims);
  assert(claims->exp_ms - claims->iat_ms == sitestore::auth::kMaxTokenTtl.count());
}

void TestConcurrentColdStartConverges() {
  FakeClock clock;
  auto      store = NewStore();

  constexpr int                                     kServices = 8;
  std::vector<std::unique_ptr<SessionTokenService>> services;
  for (int i = 0; i < kServices; ++i) services.push_back(std::make_unique<SessionTokenService>(store, clock.Fn()));

  std::vector<std::string> secrets(kServices);
  std::vector<std::thread> threads;
  for (int i = 0; i < kServices; ++i) {
    threads.emplace_back([&, i] { secrets[i] = services[i]->GetOrCreateSecret(); });
  }
  for (auto& t : threads) t.join();

  assert(std::set<std::string>(secrets.begin(), secrets.end()).size() == 1);
  assert(secrets[0].size() == 32);

  const auto token = services[0]->Issue("a@x.com", 1h);
  assert(services[kServices - 1]->Verify(token));

  const auto record = store->Get(sitestore::auth::kSessionSecretKey);
  assert(record && sitestore::kv::GetString(*record, "secret") == sitestore::util::HexEncode(secrets[0]));
}

void TestMalformedStoredSecretIsBackendError() {
  auto store = NewStore();
  store->Put(sitestore::auth::kSessionSecretKey, sitestore::kv::MakeObject({{"secret", sitestore::kv::MakeString("abc")}}));

  SessionTokenService tokens(store);
  bool                threw = false;
  try {
    (void)tokens.Issue("a@x.com", 1h);
  } catch (const sitestore::util::BackendError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestIssueAndVerify();
  TestExpiryIsStrict();
  TestAlteredSignatureFails();
  TestAlteredPayloadFails();
  TestMalformedTokensFail();
  TestHeaderMustBeHs256();
  TestRotationInvalidatesOldTokens();
  TestRotationByAnotherInstanceReachesRunningService();
  TestTtlBounds();
  TestConcurrentColdStartConverges();
  TestMalformedStoredSecretIsBackendError();

  std::cout << "sitestore_unit_session_tokens: pass\n";
  return 0;
}
