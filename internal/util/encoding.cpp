#include "encoding.hpp"

#include <openssl/evp.h>

#include <vector>

namespace sitestore::util {
namespace {

int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

} // namespace

std::string HexEncode(std::string_view bytes) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(bytes.size() * 2);
  for (const char c : bytes) {
    const auto b = static_cast<unsigned char>(c);
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

std::optional<std::string> HexDecode(std::string_view hex) {
  if (hex.size() % 2 != 0) return std::nullopt;

  std::string out;
  out.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    const int hi = HexNibble(hex[i]);
    const int lo = HexNibble(hex[i + 1]);
    if (hi < 0 || lo < 0) return std::nullopt;
    out.push_back(static_cast<char>((hi << 4) | lo));
  }
  return out;
}

std::string Base64UrlEncode(std::string_view bytes) {
  if (bytes.empty()) return {};

  // EVP_EncodeBlock writes 4 output bytes per 3 input bytes plus a NUL.
  std::vector<unsigned char> buf(4 * ((bytes.size() + 2) / 3) + 1);
  const int n = EVP_EncodeBlock(buf.data(), reinterpret_cast<const unsigned char*>(bytes.data()), static_cast<int>(bytes.size()));

  std::string out(reinterpret_cast<const char*>(buf.data()), static_cast<std::size_t>(n));
  while (!out.empty() && out.back() == '=') out.pop_back();
  for (char& c : out) {
    if (c == '+') c = '-';
    else if (c == '/') c = '_';
  }
  return out;
}

std::optional<std::string> Base64UrlDecode(std::string_view text) {
  if (text.empty()) return std::string{};
  if (text.size() % 4 == 1) return std::nullopt;

  std::string std_b64;
  std_b64.reserve(text.size() + 2);
  for (const char c : text) {
    if (c == '-') {
      std_b64.push_back('+');
    } else if (c == '_') {
      std_b64.push_back('/');
    } else if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) {
      std_b64.push_back(c);
    } else {
      // '=', whitespace and the standard alphabet's '+' '/' are not part of the URL-safe form
      return std::nullopt;
    }
  }

  const std::size_t padding = (4 - std_b64.size() % 4) % 4;
  std_b64.append(padding, '=');

  std::vector<unsigned char> buf(3 * (std_b64.size() / 4));
  const int n = EVP_DecodeBlock(buf.data(), reinterpret_cast<const unsigned char*>(std_b64.data()), static_cast<int>(std_b64.size()));
  if (n < 0) return std::nullopt;

  // EVP_DecodeBlock counts the zero bytes produced by padding.
  const std::size_t len = static_cast<std::size_t>(n) - padding;
  std::string       out(reinterpret_cast<const char*>(buf.data()), len);

  // Reject non-zero trailing bits so each byte string has exactly one encoding.
  if (Base64UrlEncode(out) != text) return std::nullopt;
  return out;
}

} // namespace sitestore::util
