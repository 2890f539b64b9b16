#pragma once

#include <initializer_list>
#include <memory>
#include <mutex>
#include <string_view>

#include "internal/db/api/kv_repository.hpp"
#include "sqlite_db.hpp"

namespace sitestore::db::sqlite {

class SqliteKvRepository final : public db::KvRepository {
public:
  explicit SqliteKvRepository(std::shared_ptr<SqliteDB> db);

  // Creates missing tables and the capability marker.
  static void Bootstrap(SqliteDB& db, bool owner_scoped);

  SchemaCapabilities DetectCapabilities() override;

  Result Upsert(const OwnerScope&, const model::KvRecord&) override;
  Result InsertIfAbsent(const OwnerScope&, const model::KvRecord&) override;
  std::optional<model::KvRecord> Find(const OwnerScope&, const std::string& key) override;
  Result Delete(const OwnerScope&, const std::string& key) override;
  std::vector<std::string> ListKeysWithPrefix(const OwnerScope&, const std::string& prefix) override;

  Result AppendAudit(const OwnerScope&, const model::AuditRecord&) override;

private:
  // caller holds mutex_
  Result Execute(const char* sql, std::initializer_list<std::string_view> params, int* changes = nullptr);

  static Result Translate(sqlite3* db, int rc);
  [[noreturn]] static void Throw(sqlite3* db, int rc, const char* context);

  std::shared_ptr<SqliteDB> db_;

  // One connection; statements from different callers must not interleave.
  std::mutex mutex_;
};

}
