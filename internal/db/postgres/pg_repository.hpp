#pragma once

#include <memory>

#include "internal/db/api/kv_repository.hpp"
#include "pg_pool.hpp"

namespace sitestore::db::postgres {

class PgKvRepository final : public db::KvRepository {
public:
  explicit PgKvRepository(std::shared_ptr<PgPool> pool);

  // Creates missing tables and the capability marker in one transaction.
  static void Bootstrap(PgPool& pool, bool owner_scoped);

  SchemaCapabilities DetectCapabilities() override;

  Result Upsert(const OwnerScope&, const model::KvRecord&) override;
  Result InsertIfAbsent(const OwnerScope&, const model::KvRecord&) override;
  std::optional<model::KvRecord> Find(const OwnerScope&, const std::string& key) override;
  Result Delete(const OwnerScope&, const std::string& key) override;
  std::vector<std::string> ListKeysWithPrefix(const OwnerScope&, const std::string& prefix) override;

  Result AppendAudit(const OwnerScope&, const model::AuditRecord&) override;

private:
  std::shared_ptr<PgPool> pool_;

  static Result Translate(const std::exception&);
  [[noreturn]] static void Rethrow(const std::exception&, const char* context);
};

}
