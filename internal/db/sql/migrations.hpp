#pragma once

#include <string>
#include <vector>

namespace sitestore::db::sql {

enum class Dialect {
  kSqlite,
  kPostgres,
};

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

/*
  Bootstrap schema.

  Creates app_data / user_logs when missing (with or without the user_id
  discriminator), then records the capability marker row describing the
  tables as they actually exist. An existing marker is never rewritten.
*/
std::vector<std::string> BootstrapStatements(Dialect dialect, bool owner_scoped);

/*
  Runs migrations in order.
*/

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

} // namespace sitestore::db::sql
