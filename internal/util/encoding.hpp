#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace sitestore::util {

/*
  Byte-string encodings used at the storage and token edges.

  Byte sequences are carried in std::string.
*/

std::string                HexEncode(std::string_view bytes);
std::optional<std::string> HexDecode(std::string_view hex);

// RFC 4648 §5 alphabet, no padding.
std::string                Base64UrlEncode(std::string_view bytes);
std::optional<std::string> Base64UrlDecode(std::string_view text);

} // namespace sitestore::util
