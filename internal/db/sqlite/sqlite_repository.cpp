#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/like_pattern.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace sitestore::db::sqlite {

namespace {

using Statement = SqliteDB::Statement;

int PrepareStatement(sqlite3* db, const char* sql, Statement& out) {
  sqlite3_stmt* st = nullptr;
  const int     rc = sqlite3_prepare_v2(db, sql, -1, &st, nullptr);
  out.reset(st);
  return rc;
}

int BindTexts(sqlite3_stmt* st, std::initializer_list<std::string_view> params) {
  int idx = 1;
  for (const auto& p : params) {
    // a null data pointer would bind SQL NULL instead of ''
    const char* data = p.data() ? p.data() : "";
    const int   rc   = sqlite3_bind_text(st, idx++, data, static_cast<int>(p.size()), SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) return rc;
  }
  return SQLITE_OK;
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  const int            n = sqlite3_column_bytes(st, col);
  return t ? std::string(reinterpret_cast<const char*>(t), static_cast<std::size_t>(n)) : std::string{};
}

class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& statement) override {
    db_.Exec(statement);
  }

 private:
  SqliteDB& db_;
};

} // namespace

SqliteKvRepository::SqliteKvRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

void SqliteKvRepository::Bootstrap(SqliteDB& db, bool owner_scoped) {
  SqliteMigrationExecutor executor(db);
  sql::RunMigrations(executor, sql::BootstrapStatements(sql::Dialect::kSqlite, owner_scoped));
}

Result SqliteKvRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CANTOPEN:
      return Result::Err(ErrorCode::Unavailable, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

void SqliteKvRepository::Throw(sqlite3* db, int rc, const char* context) {
  const auto result  = Translate(db, rc);
  const auto message = std::string(context) + ": " + result.message;
  if (IsTransient(result.code)) {
    throw util::BackendUnavailable(message);
  }
  throw util::BackendError(message);
}

Result SqliteKvRepository::Execute(const char* sql, std::initializer_list<std::string_view> params, int* changes) {
  auto*     db = db_->Handle();
  Statement st;

  int rc = PrepareStatement(db, sql, st);
  if (rc != SQLITE_OK) return Translate(db, rc);

  rc = BindTexts(st.get(), params);
  if (rc != SQLITE_OK) return Translate(db, rc);

  rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);

  if (changes) *changes = sqlite3_changes(db);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Capabilities
// ------------------------------------------------------------------

SchemaCapabilities SqliteKvRepository::DetectCapabilities() {
  std::lock_guard lock(mutex_);
  auto*           db = db_->Handle();

  {
    Statement marker;
    // a missing marker table is not an error; fall through to the catalog
    if (PrepareStatement(db, sql::SELECT_CAPABILITY_MARKER, marker) == SQLITE_OK) {
      const int rc = sqlite3_step(marker.get());
      if (rc == SQLITE_ROW) {
        SchemaCapabilities caps;
        caps.kv_owner_column    = sqlite3_column_int(marker.get(), 0) != 0;
        caps.audit_owner_column = sqlite3_column_int(marker.get(), 1) != 0;
        return caps;
      }
      if (rc != SQLITE_DONE) Throw(db, rc, "read capability marker");
    }
  }

  Statement columns;
  int       rc = PrepareStatement(db, sql::SELECT_OWNER_COLUMNS, columns);
  if (rc != SQLITE_OK) Throw(db, rc, "inspect table columns");

  SchemaCapabilities caps;
  while ((rc = sqlite3_step(columns.get())) == SQLITE_ROW) {
    const auto table = ColText(columns.get(), 0);
    if (table == "app_data") caps.kv_owner_column = true;
    if (table == "user_logs") caps.audit_owner_column = true;
  }
  if (rc != SQLITE_DONE) Throw(db, rc, "inspect table columns");
  return caps;
}

// ------------------------------------------------------------------
// Key/value
// ------------------------------------------------------------------

Result SqliteKvRepository::Upsert(const OwnerScope& scope, const model::KvRecord& r) {
  std::lock_guard lock(mutex_);
  if (scope.owner_id) {
    return Execute(sql::UPSERT_KV_OWNED, {r.key, r.json, *scope.owner_id});
  }
  return Execute(sql::UPSERT_KV, {r.key, r.json});
}

Result SqliteKvRepository::InsertIfAbsent(const OwnerScope& scope, const model::KvRecord& r) {
  std::lock_guard lock(mutex_);
  int             changes = 0;
  auto            result  = scope.owner_id ? Execute(sql::INSERT_KV_IF_ABSENT_OWNED, {r.key, r.json, *scope.owner_id}, &changes)
                                           : Execute(sql::INSERT_KV_IF_ABSENT, {r.key, r.json}, &changes);
  if (!result) return result;
  if (changes == 0) return Result::Err(ErrorCode::AlreadyExists, r.key);
  return Result::Ok();
}

std::optional<model::KvRecord> SqliteKvRepository::Find(const OwnerScope& scope, const std::string& key) {
  std::lock_guard lock(mutex_);
  auto*           db = db_->Handle();

  Statement st;
  int       rc = PrepareStatement(db, scope.owner_id ? sql::SELECT_KV_OWNED : sql::SELECT_KV, st);
  if (rc != SQLITE_OK) Throw(db, rc, "get");

  rc = scope.owner_id ? BindTexts(st.get(), {key, *scope.owner_id}) : BindTexts(st.get(), {key});
  if (rc != SQLITE_OK) Throw(db, rc, "get");

  rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) Throw(db, rc, "get");

  model::KvRecord r;
  r.key           = ColText(st.get(), 0);
  r.json          = ColText(st.get(), 1);
  r.updated_at_ms = sqlite3_column_int64(st.get(), 2);
  return r;
}

Result SqliteKvRepository::Delete(const OwnerScope& scope, const std::string& key) {
  std::lock_guard lock(mutex_);
  if (scope.owner_id) {
    return Execute(sql::DELETE_KV_OWNED, {key, *scope.owner_id});
  }
  return Execute(sql::DELETE_KV, {key});
}

std::vector<std::string> SqliteKvRepository::ListKeysWithPrefix(const OwnerScope& scope, const std::string& prefix) {
  std::lock_guard lock(mutex_);
  auto*           db      = db_->Handle();
  const auto      pattern = sql::LikePrefixPattern(prefix);

  Statement st;
  int       rc = PrepareStatement(db, scope.owner_id ? sql::LIST_KV_KEYS_OWNED : sql::LIST_KV_KEYS, st);
  if (rc != SQLITE_OK) Throw(db, rc, "list keys");

  rc = scope.owner_id ? BindTexts(st.get(), {pattern, *scope.owner_id}) : BindTexts(st.get(), {pattern});
  if (rc != SQLITE_OK) Throw(db, rc, "list keys");

  std::vector<std::string> keys;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    keys.push_back(ColText(st.get(), 0));
  }
  if (rc != SQLITE_DONE) Throw(db, rc, "list keys");
  return keys;
}

// ------------------------------------------------------------------
// Audit
// ------------------------------------------------------------------

Result SqliteKvRepository::AppendAudit(const OwnerScope& scope, const model::AuditRecord& r) {
  std::lock_guard lock(mutex_);
  if (scope.owner_id) {
    return Execute(sql::INSERT_AUDIT_OWNED, {r.event, r.details_json, *scope.owner_id});
  }
  return Execute(sql::INSERT_AUDIT, {r.event, r.details_json});
}

} // namespace sitestore::db::sqlite
