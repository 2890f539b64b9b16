#include "pg_repository.hpp"

#include <string_view>

#include "internal/db/sql/like_pattern.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/util/errors.hpp"

namespace sitestore::db::postgres {

namespace {

// SQLSTATE classes that mean "the server or the link went away", not "the statement was wrong".
bool IsTransientSqlState(std::string_view state) {
  return state == "57014"                    // query_canceled (statement_timeout, cancel request)
         || state.substr(0, 2) == "08"       // connection exception
         || state == "57P01" || state == "57P02" || state == "57P03" // admin/crash shutdown, cannot connect now
         || state == "53300";                // too_many_connections
}

class PgMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(pqxx::work& tx) : tx_(tx) {
  }

  void ExecuteSQL(const std::string& statement) override {
    tx_.exec(statement);
  }

 private:
  pqxx::work& tx_;
};

} // namespace

PgKvRepository::PgKvRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

void PgKvRepository::Bootstrap(PgPool& pool, bool owner_scoped) {
  try {
    auto       conn = pool.Acquire();
    pqxx::work tx(*conn);

    PgMigrationExecutor executor(tx);
    sql::RunMigrations(executor, sql::BootstrapStatements(sql::Dialect::kPostgres, owner_scoped));
    tx.commit();
  } catch (const std::exception& e) {
    Rethrow(e, "bootstrap schema");
  }
}

Result PgKvRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const util::BackendUnavailable*>(&e) || dynamic_cast<const pqxx::broken_connection*>(&e) ||
      dynamic_cast<const pqxx::in_doubt_error*>(&e)) {
    return Result::Err(ErrorCode::Unavailable, e.what());
  }

  if (const auto* sql_error = dynamic_cast<const pqxx::sql_error*>(&e)) {
    const std::string state = sql_error->sqlstate();
    if (IsTransientSqlState(state)) {
      return Result::Err(ErrorCode::Unavailable, e.what());
    }
    if (state == "40001" || state == "40P01") {
      return Result::Err(ErrorCode::Busy, e.what());
    }
    if (state.rfind("23", 0) == 0) {
      return Result::Err(ErrorCode::ConstraintViolation, e.what());
    }
  }

  return Result::Err(ErrorCode::InternalError, e.what());
}

void PgKvRepository::Rethrow(const std::exception& e, const char* context) {
  const auto result  = Translate(e);
  const auto message = std::string(context) + ": " + result.message;
  if (IsTransient(result.code)) {
    throw util::BackendUnavailable(message);
  }
  throw util::BackendError(message);
}

// ------------------------------------------------------------------
// Capabilities
// ------------------------------------------------------------------

SchemaCapabilities PgKvRepository::DetectCapabilities() {
  try {
    auto conn = pool_->Acquire();

    try {
      pqxx::nontransaction tx(*conn);
      auto res = tx.exec("SELECT kv_owner_column, audit_owner_column FROM sitestore_schema_version WHERE id = 1;");
      if (!res.empty()) {
        SchemaCapabilities caps;
        caps.kv_owner_column    = res[0][0].as<bool>();
        caps.audit_owner_column = res[0][1].as<bool>();
        return caps;
      }
    } catch (const pqxx::sql_error& e) {
      // undefined_table: no marker yet, inspect the catalog instead
      if (e.sqlstate() != "42P01") throw;
    }

    pqxx::nontransaction tx(*conn);
    auto res = tx.exec(
        "SELECT table_name FROM information_schema.columns "
        "WHERE table_schema = current_schema() AND table_name IN ('app_data', 'user_logs') AND column_name = 'user_id';");

    SchemaCapabilities caps;
    for (const auto& row : res) {
      const std::string table = row[0].c_str();
      if (table == "app_data") caps.kv_owner_column = true;
      if (table == "user_logs") caps.audit_owner_column = true;
    }
    return caps;
  } catch (const std::exception& e) {
    Rethrow(e, "detect capabilities");
  }
}

// ------------------------------------------------------------------
// Key/value
// ------------------------------------------------------------------

Result PgKvRepository::Upsert(const OwnerScope& scope, const model::KvRecord& r) {
  try {
    auto       conn = pool_->Acquire();
    pqxx::work tx(*conn);
    if (scope.owner_id) {
      tx.exec_params(
          "INSERT INTO app_data (key, value, user_id) VALUES ($1, $2::jsonb, $3) "
          "ON CONFLICT (key, user_id) DO UPDATE SET value = EXCLUDED.value, updated_at = NOW();",
          r.key, r.json, *scope.owner_id);
    } else {
      tx.exec_params(
          "INSERT INTO app_data (key, value) VALUES ($1, $2::jsonb) "
          "ON CONFLICT (key) DO UPDATE SET value = EXCLUDED.value, updated_at = NOW();",
          r.key, r.json);
    }
    tx.commit();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgKvRepository::InsertIfAbsent(const OwnerScope& scope, const model::KvRecord& r) {
  try {
    auto         conn = pool_->Acquire();
    pqxx::work   tx(*conn);
    pqxx::result res;
    if (scope.owner_id) {
      res = tx.exec_params(
          "INSERT INTO app_data (key, value, user_id) VALUES ($1, $2::jsonb, $3) ON CONFLICT (key, user_id) DO NOTHING;",
          r.key, r.json, *scope.owner_id);
    } else {
      res = tx.exec_params("INSERT INTO app_data (key, value) VALUES ($1, $2::jsonb) ON CONFLICT (key) DO NOTHING;", r.key, r.json);
    }
    tx.commit();
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists, r.key);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::KvRecord> PgKvRepository::Find(const OwnerScope& scope, const std::string& key) {
  try {
    auto                  conn = pool_->Acquire();
    pqxx::read_transaction tx(*conn);
    pqxx::result          res;
    if (scope.owner_id) {
      res = tx.exec_params(
          "SELECT key, value::text, COALESCE((EXTRACT(EPOCH FROM updated_at) * 1000)::bigint, 0) "
          "FROM app_data WHERE key = $1 AND user_id = $2;",
          key, *scope.owner_id);
    } else {
      res = tx.exec_params(
          "SELECT key, value::text, COALESCE((EXTRACT(EPOCH FROM updated_at) * 1000)::bigint, 0) FROM app_data WHERE key = $1;", key);
    }
    tx.commit();
    if (res.empty()) return std::nullopt;

    model::KvRecord r;
    r.key           = res[0][0].c_str();
    r.json          = res[0][1].c_str();
    r.updated_at_ms = res[0][2].as<int64_t>();
    return r;
  } catch (const std::exception& e) {
    Rethrow(e, "get");
  }
}

Result PgKvRepository::Delete(const OwnerScope& scope, const std::string& key) {
  try {
    auto       conn = pool_->Acquire();
    pqxx::work tx(*conn);
    if (scope.owner_id) {
      tx.exec_params("DELETE FROM app_data WHERE key = $1 AND user_id = $2;", key, *scope.owner_id);
    } else {
      tx.exec_params("DELETE FROM app_data WHERE key = $1;", key);
    }
    tx.commit();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<std::string> PgKvRepository::ListKeysWithPrefix(const OwnerScope& scope, const std::string& prefix) {
  try {
    const auto             pattern = sql::LikePrefixPattern(prefix);
    auto                   conn    = pool_->Acquire();
    pqxx::read_transaction tx(*conn);
    pqxx::result           res;
    // COLLATE "C" orders by byte value regardless of the database locale
    if (scope.owner_id) {
      res = tx.exec_params(
          "SELECT key FROM app_data WHERE key LIKE $1 ESCAPE '\\' AND user_id = $2 ORDER BY key COLLATE \"C\" DESC;", pattern,
          *scope.owner_id);
    } else {
      res = tx.exec_params("SELECT key FROM app_data WHERE key LIKE $1 ESCAPE '\\' ORDER BY key COLLATE \"C\" DESC;", pattern);
    }
    tx.commit();

    std::vector<std::string> keys;
    keys.reserve(res.size());
    for (const auto& row : res) {
      keys.emplace_back(row[0].c_str());
    }
    return keys;
  } catch (const std::exception& e) {
    Rethrow(e, "list keys");
  }
}

// ------------------------------------------------------------------
// Audit
// ------------------------------------------------------------------

Result PgKvRepository::AppendAudit(const OwnerScope& scope, const model::AuditRecord& r) {
  try {
    auto       conn = pool_->Acquire();
    pqxx::work tx(*conn);
    if (scope.owner_id) {
      tx.exec_params("INSERT INTO user_logs (event, details, user_id) VALUES ($1, $2::jsonb, $3);", r.event, r.details_json,
                     *scope.owner_id);
    } else {
      tx.exec_params("INSERT INTO user_logs (event, details) VALUES ($1, $2::jsonb);", r.event, r.details_json);
    }
    tx.commit();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace sitestore::db::postgres
