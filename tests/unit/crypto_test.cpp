#include "internal/auth/crypto.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/encoding.hpp"

namespace {

using sitestore::util::HexEncode;

void TestPbkdf2KnownAnswers() {
  // RFC 7914 §11 style vectors for PBKDF2-HMAC-SHA256
  assert(HexEncode(sitestore::auth::Pbkdf2HmacSha256("password", "salt", 1)) ==
         "120fb6cffcf8b32c43e7225256c4f837a86548c92ccc35480805987cb70be17b");
  assert(HexEncode(sitestore::auth::Pbkdf2HmacSha256("password", "salt", 2)) ==
         "ae4d0c95af6b46d32d0adff928f06dd02a303f8ef3c251dfd6e2d85a95474c43");
  assert(sitestore::auth::Pbkdf2HmacSha256("password", "salt", 1, 16).size() == 16);
}

void TestHmacKnownAnswer() {
  // RFC 4231 test case 2
  assert(HexEncode(sitestore::auth::HmacSha256("Jefe", "what do ya want for nothing?")) ==
         "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
  assert(sitestore::auth::HmacSha256("", "data").size() == sitestore::auth::kSha256Bytes);
}

void TestRandomBytes() {
  const auto a = sitestore::auth::RandomBytes(32);
  const auto b = sitestore::auth::RandomBytes(32);
  assert(a.size() == 32);
  assert(a != b);
  assert(sitestore::auth::RandomBytes(0).empty());
}

void TestConstantTimeEquals() {
  assert(sitestore::auth::ConstantTimeEquals("abc", "abc"));
  assert(!sitestore::auth::ConstantTimeEquals("abc", "abd"));
  assert(!sitestore::auth::ConstantTimeEquals("abc", "abcd"));
  assert(sitestore::auth::ConstantTimeEquals("", ""));
}

void TestZeroIterationsRejected() {
  bool threw = false;
  try {
    (void)sitestore::auth::Pbkdf2HmacSha256("password", "salt", 0);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestPbkdf2KnownAnswers();
  TestHmacKnownAnswer();
  TestRandomBytes();
  TestConstantTimeEquals();
  TestZeroIterationsRejected();

  std::cout << "sitestore_unit_crypto: pass\n";
  return 0;
}
