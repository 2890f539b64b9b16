#include "kv_store.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace sitestore::kv {

namespace {

// A concurrent delete can remove the winning row between insert and read.
constexpr int kPutIfAbsentAttempts = 3;

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  if (db::IsTransient(result.code)) {
    throw util::BackendUnavailable(message);
  }
  throw util::BackendError(message);
}

} // namespace

KvStore::KvStore(std::shared_ptr<db::KvRepository> repository, service::StoreContext context)
    : repository_(std::move(repository)), context_(std::move(context)) {
}

void KvStore::Put(const std::string& key, const Value& value) {
  db::model::KvRecord record;
  record.key  = key;
  record.json = ToJson(value);
  ThrowIfDbError(repository_->Upsert(context_.KvScope(), record), "put " + key);
}

std::optional<Value> KvStore::Get(const std::string& key) const {
  auto record = repository_->Find(context_.KvScope(), key);
  if (!record) return std::nullopt;
  return FromJson(record->json);
}

void KvStore::Delete(const std::string& key) {
  ThrowIfDbError(repository_->Delete(context_.KvScope(), key), "delete " + key);
}

std::vector<std::string> KvStore::ListKeysWithPrefix(const std::string& prefix) const {
  // SQL LIKE stops at an embedded NUL and Postgres text cannot hold one.
  if (prefix.find('\0') != std::string::npos) {
    throw std::invalid_argument("list prefix must not contain NUL");
  }
  return repository_->ListKeysWithPrefix(context_.KvScope(), prefix);
}

Value KvStore::PutIfAbsent(const std::string& key, const Value& value) {
  db::model::KvRecord record;
  record.key  = key;
  record.json = ToJson(value);

  const auto scope = context_.KvScope();
  for (int attempt = 0; attempt < kPutIfAbsentAttempts; ++attempt) {
    auto result = repository_->InsertIfAbsent(scope, record);
    if (result) return value;
    if (result.code != db::ErrorCode::AlreadyExists) ThrowIfDbError(result, "put-if-absent " + key);

    auto existing = repository_->Find(scope, key);
    if (existing) return FromJson(existing->json);
  }

  throw util::BackendError("put-if-absent " + key + ": row kept disappearing under concurrent deletes");
}

} // namespace sitestore::kv
