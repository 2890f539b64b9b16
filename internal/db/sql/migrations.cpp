#include "migrations.hpp"

namespace sitestore::db::sql {
namespace {

constexpr int kSchemaVersion = 1;

std::vector<std::string> SqliteBootstrap(bool owner_scoped) {
  static constexpr const char* kNowMs = "(CAST((julianday('now') - 2440587.5) * 86400000 AS INTEGER))";

  std::vector<std::string> out;
  if (owner_scoped) {
    out.push_back(std::string("CREATE TABLE IF NOT EXISTS app_data (key TEXT NOT NULL, value TEXT NOT NULL, user_id TEXT NOT NULL, "
                              "updated_at INTEGER NOT NULL DEFAULT ") +
                  kNowMs + ", PRIMARY KEY (key, user_id));");
    out.push_back(std::string("CREATE TABLE IF NOT EXISTS user_logs (id INTEGER PRIMARY KEY AUTOINCREMENT, event TEXT NOT NULL, "
                              "details TEXT NOT NULL DEFAULT '{}', user_id TEXT, created_at INTEGER NOT NULL DEFAULT ") +
                  kNowMs + ");");
  } else {
    out.push_back(std::string("CREATE TABLE IF NOT EXISTS app_data (key TEXT PRIMARY KEY, value TEXT NOT NULL, "
                              "updated_at INTEGER NOT NULL DEFAULT ") +
                  kNowMs + ");");
    out.push_back(std::string("CREATE TABLE IF NOT EXISTS user_logs (id INTEGER PRIMARY KEY AUTOINCREMENT, event TEXT NOT NULL, "
                              "details TEXT NOT NULL DEFAULT '{}', created_at INTEGER NOT NULL DEFAULT ") +
                  kNowMs + ");");
  }

  out.push_back(std::string("CREATE TABLE IF NOT EXISTS sitestore_schema_version (id INTEGER PRIMARY KEY CHECK (id = 1), "
                            "version INTEGER NOT NULL, kv_owner_column INTEGER NOT NULL, audit_owner_column INTEGER NOT NULL, "
                            "applied_at INTEGER NOT NULL DEFAULT ") +
                kNowMs + ");");
  out.push_back("INSERT OR IGNORE INTO sitestore_schema_version (id, version, kv_owner_column, audit_owner_column) SELECT 1, " +
                std::to_string(kSchemaVersion) +
                ", EXISTS (SELECT 1 FROM pragma_table_info('app_data') WHERE name = 'user_id'),"
                " EXISTS (SELECT 1 FROM pragma_table_info('user_logs') WHERE name = 'user_id');");
  return out;
}

std::vector<std::string> PostgresBootstrap(bool owner_scoped) {
  std::vector<std::string> out;
  if (owner_scoped) {
    out.push_back(
        "CREATE TABLE IF NOT EXISTS app_data (key TEXT NOT NULL, value JSONB NOT NULL, user_id TEXT NOT NULL, "
        "updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW(), PRIMARY KEY (key, user_id));");
    out.push_back(
        "CREATE TABLE IF NOT EXISTS user_logs (id BIGSERIAL PRIMARY KEY, event TEXT NOT NULL, "
        "details JSONB NOT NULL DEFAULT '{}'::jsonb, user_id TEXT, created_at TIMESTAMPTZ NOT NULL DEFAULT NOW());");
  } else {
    out.push_back(
        "CREATE TABLE IF NOT EXISTS app_data (key TEXT PRIMARY KEY, value JSONB NOT NULL, "
        "updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW());");
    out.push_back(
        "CREATE TABLE IF NOT EXISTS user_logs (id BIGSERIAL PRIMARY KEY, event TEXT NOT NULL, "
        "details JSONB NOT NULL DEFAULT '{}'::jsonb, created_at TIMESTAMPTZ NOT NULL DEFAULT NOW());");
  }

  out.push_back(
      "CREATE TABLE IF NOT EXISTS sitestore_schema_version (id INTEGER PRIMARY KEY CHECK (id = 1), "
      "version INTEGER NOT NULL, kv_owner_column BOOLEAN NOT NULL, audit_owner_column BOOLEAN NOT NULL, "
      "applied_at TIMESTAMPTZ NOT NULL DEFAULT NOW());");
  out.push_back(
      "INSERT INTO sitestore_schema_version (id, version, kv_owner_column, audit_owner_column) SELECT 1, " + std::to_string(kSchemaVersion) +
      ", EXISTS (SELECT 1 FROM information_schema.columns WHERE table_schema = current_schema() AND table_name = 'app_data' AND column_name = 'user_id'),"
      " EXISTS (SELECT 1 FROM information_schema.columns WHERE table_schema = current_schema() AND table_name = 'user_logs' AND column_name = 'user_id')"
      " ON CONFLICT (id) DO NOTHING;");
  return out;
}

} // namespace

std::vector<std::string> BootstrapStatements(Dialect dialect, bool owner_scoped) {
  switch (dialect) {
    case Dialect::kSqlite:
      return SqliteBootstrap(owner_scoped);
    case Dialect::kPostgres:
      return PostgresBootstrap(owner_scoped);
  }
  return {};
}

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& statement : ordered_sql) {
    executor.ExecuteSQL(statement);
  }
}

} // namespace sitestore::db::sql
