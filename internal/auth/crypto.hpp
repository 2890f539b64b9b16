#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace sitestore::auth {

/*
  Thin OpenSSL libcrypto wrappers. Byte strings are carried in std::string.

  All functions throw std::runtime_error when libcrypto reports a failure.
*/

inline constexpr std::size_t kSha256Bytes = 32;

// CSPRNG output.
std::string RandomBytes(std::size_t n);

std::string HmacSha256(std::string_view key, std::string_view data);

std::string Pbkdf2HmacSha256(std::string_view password, std::string_view salt, uint32_t iterations,
                             std::size_t out_len = kSha256Bytes);

// Runtime depends only on length, never on content.
bool ConstantTimeEquals(std::string_view a, std::string_view b);

} // namespace sitestore::auth
