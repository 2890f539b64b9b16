#include "crypto.hpp"

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include <climits>
#include <stdexcept>

namespace sitestore::auth {

namespace {

[[noreturn]] void ThrowOpenSSLError(const char* context) {
  const unsigned long err = ERR_get_error();
  if (err == 0) {
    throw std::runtime_error(std::string(context) + ": unknown OpenSSL error");
  }

  char buf[256] = {0};
  ERR_error_string_n(err, buf, sizeof(buf));
  throw std::runtime_error(std::string(context) + ": " + buf);
}

const unsigned char* Bytes(std::string_view s) {
  return reinterpret_cast<const unsigned char*>(s.data());
}

} // namespace

std::string RandomBytes(std::size_t n) {
  std::string out(n, '\0');
  if (n == 0) return out;
  if (n > INT_MAX) throw std::runtime_error("RAND_bytes: request too large");
  if (RAND_bytes(reinterpret_cast<unsigned char*>(out.data()), static_cast<int>(n)) != 1) {
    ThrowOpenSSLError("RAND_bytes");
  }
  return out;
}

std::string HmacSha256(std::string_view key, std::string_view data) {
  unsigned char out[EVP_MAX_MD_SIZE];
  unsigned int  out_len = 0;
  // HMAC rejects a null key pointer even for an empty key
  static const unsigned char kEmpty = 0;
  const void*                key_ptr = key.empty() ? &kEmpty : static_cast<const void*>(key.data());
  if (HMAC(EVP_sha256(), key_ptr, static_cast<int>(key.size()), Bytes(data), data.size(), out, &out_len) == nullptr) {
    ThrowOpenSSLError("HMAC(EVP_sha256)");
  }
  return std::string(reinterpret_cast<const char*>(out), out_len);
}

std::string Pbkdf2HmacSha256(std::string_view password, std::string_view salt, uint32_t iterations, std::size_t out_len) {
  if (iterations == 0 || iterations > INT_MAX) throw std::runtime_error("PBKDF2: iteration count out of range");

  std::string out(out_len, '\0');
  if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()), Bytes(salt), static_cast<int>(salt.size()),
                        static_cast<int>(iterations), EVP_sha256(), static_cast<int>(out_len),
                        reinterpret_cast<unsigned char*>(out.data())) != 1) {
    ThrowOpenSSLError("PKCS5_PBKDF2_HMAC");
  }
  return out;
}

bool ConstantTimeEquals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  if (a.empty()) return true;
  return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace sitestore::auth
