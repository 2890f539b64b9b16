#pragma once

#include <stdexcept>
#include <string>

namespace sitestore::util {

/*
  Central error types.

  Backend failures surface to callers as one of these two.
  Authentication failures are never exceptions; they are plain
  negative results.
*/

// Connection, transport, pool exhaustion or statement cancellation.
// Retryable by the caller; the store never retries on its own.
class BackendUnavailable : public std::runtime_error {
 public:
  explicit BackendUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The backend rejected the statement or returned data that cannot be decoded.
class BackendError : public std::runtime_error {
 public:
  explicit BackendError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace sitestore::util
