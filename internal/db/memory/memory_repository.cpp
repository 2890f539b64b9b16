#include "memory_repository.hpp"

#include "internal/util/time.hpp"

namespace sitestore::db::memory {

namespace {

std::string OwnerOf(const OwnerScope& scope) {
  return scope.owner_id.value_or(std::string{});
}

} // namespace

MemoryKvRepository::MemoryKvRepository(SchemaCapabilities capabilities) : capabilities_(capabilities) {
}

SchemaCapabilities MemoryKvRepository::DetectCapabilities() {
  return capabilities_;
}

Result MemoryKvRepository::Upsert(const OwnerScope& scope, const model::KvRecord& r) {
  std::lock_guard lock(mutex_);

  auto& row         = rows_[{OwnerOf(scope), r.key}];
  row.key           = r.key;
  row.json          = r.json;
  row.updated_at_ms = util::ToUnixMillis(util::Now());
  return Result::Ok();
}

Result MemoryKvRepository::InsertIfAbsent(const OwnerScope& scope, const model::KvRecord& r) {
  std::lock_guard lock(mutex_);

  const RowKey id{OwnerOf(scope), r.key};
  if (rows_.contains(id)) return Result::Err(ErrorCode::AlreadyExists, r.key);

  model::KvRecord row = r;
  row.updated_at_ms   = util::ToUnixMillis(util::Now());
  rows_.emplace(id, std::move(row));
  return Result::Ok();
}

std::optional<model::KvRecord> MemoryKvRepository::Find(const OwnerScope& scope, const std::string& key) {
  std::lock_guard lock(mutex_);

  auto it = rows_.find({OwnerOf(scope), key});
  if (it == rows_.end()) return std::nullopt;
  return it->second;
}

Result MemoryKvRepository::Delete(const OwnerScope& scope, const std::string& key) {
  std::lock_guard lock(mutex_);
  rows_.erase({OwnerOf(scope), key});
  return Result::Ok();
}

std::vector<std::string> MemoryKvRepository::ListKeysWithPrefix(const OwnerScope& scope, const std::string& prefix) {
  std::lock_guard lock(mutex_);

  const auto owner = OwnerOf(scope);

  std::vector<std::string> keys;
  for (auto it = rows_.lower_bound({owner, prefix}); it != rows_.end(); ++it) {
    const auto& [row_owner, key] = it->first;
    if (row_owner != owner || key.compare(0, prefix.size(), prefix) != 0) break;
    keys.push_back(key);
  }

  // ascending scan, descending result
  return {keys.rbegin(), keys.rend()};
}

Result MemoryKvRepository::AppendAudit(const OwnerScope& scope, const model::AuditRecord& r) {
  std::lock_guard lock(mutex_);
  audit_.push_back({scope.owner_id, r});
  return Result::Ok();
}

std::vector<MemoryKvRepository::StoredAudit> MemoryKvRepository::AuditTrail() const {
  std::lock_guard lock(mutex_);
  return audit_;
}

} // namespace sitestore::db::memory
