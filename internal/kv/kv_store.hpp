#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/kv_repository.hpp"
#include "internal/kv/value.hpp"
#include "internal/service/store_context.hpp"

namespace sitestore::kv {

/*
  KvStore

  Opaque string key -> Value, scoped by the negotiated StoreContext.

  Every call is one backend round-trip (PutIfAbsent: two). Failures surface
  as util::BackendUnavailable (retryable) or util::BackendError; a missing
  key is never an error. No retries happen here.
*/
class KvStore {
public:
  KvStore(std::shared_ptr<db::KvRepository> repository, service::StoreContext context);

  void Put(const std::string& key, const Value& value);

  std::optional<Value> Get(const std::string& key) const;

  // Absent key is a no-op.
  void Delete(const std::string& key);

  // Keys starting with prefix (matched literally), descending byte order.
  // Throws std::invalid_argument for a prefix containing NUL.
  std::vector<std::string> ListKeysWithPrefix(const std::string& prefix) const;

  // Stores value unless key exists; returns whichever value is stored afterwards.
  // Concurrent callers all observe the same winner.
  Value PutIfAbsent(const std::string& key, const Value& value);

  const service::StoreContext& Context() const {
    return context_;
  }

private:
  std::shared_ptr<db::KvRepository> repository_;
  service::StoreContext             context_;
};

} // namespace sitestore::kv
