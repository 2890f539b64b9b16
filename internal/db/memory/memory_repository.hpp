#pragma once

#include <map>
#include <mutex>
#include <utility>
#include <vector>

#include "internal/db/api/kv_repository.hpp"

namespace sitestore::db::memory {

/*
  Process-local backend.

  Rows are keyed by (owner, key); an unscoped statement uses the empty owner.
  std::map keeps keys in byte order, so prefix listing is a reverse range scan.
*/
class MemoryKvRepository : public db::KvRepository {
public:
  explicit MemoryKvRepository(SchemaCapabilities capabilities = {});

  SchemaCapabilities DetectCapabilities() override;

  Result Upsert(const OwnerScope&, const model::KvRecord&) override;
  Result InsertIfAbsent(const OwnerScope&, const model::KvRecord&) override;
  std::optional<model::KvRecord> Find(const OwnerScope&, const std::string& key) override;
  Result Delete(const OwnerScope&, const std::string& key) override;
  std::vector<std::string> ListKeysWithPrefix(const OwnerScope&, const std::string& prefix) override;

  Result AppendAudit(const OwnerScope&, const model::AuditRecord&) override;

  struct StoredAudit {
    std::optional<std::string> owner_id;
    model::AuditRecord         record;
  };

  std::vector<StoredAudit> AuditTrail() const;

private:
  using RowKey = std::pair<std::string, std::string>; // (owner, key)

  SchemaCapabilities capabilities_;

  mutable std::mutex                  mutex_;
  std::map<RowKey, model::KvRecord>   rows_;
  std::vector<StoredAudit>            audit_;
};

} // namespace sitestore::db::memory
