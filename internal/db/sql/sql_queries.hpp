#pragma once

namespace sitestore::db::sql {

/*
  Canonical SQL for the SQLite backend.

  Every statement exists in two shapes: unscoped, and scoped by the
  user_id discriminator. Only the shape matching the negotiated
  capabilities is ever prepared, so the scoped text never reaches a
  table that lacks the column.

  updated_at / created_at are epoch milliseconds.
*/

#define SITESTORE_SQLITE_NOW_MS "CAST((julianday('now') - 2440587.5) * 86400000 AS INTEGER)"

// key/value

static constexpr const char* UPSERT_KV =
    "INSERT INTO app_data(key,value,updated_at) VALUES(?1,?2," SITESTORE_SQLITE_NOW_MS ")"
    " ON CONFLICT(key) DO UPDATE SET value=excluded.value, updated_at=" SITESTORE_SQLITE_NOW_MS ";";

static constexpr const char* UPSERT_KV_OWNED =
    "INSERT INTO app_data(key,value,user_id,updated_at) VALUES(?1,?2,?3," SITESTORE_SQLITE_NOW_MS ")"
    " ON CONFLICT(key,user_id) DO UPDATE SET value=excluded.value, updated_at=" SITESTORE_SQLITE_NOW_MS ";";

static constexpr const char* INSERT_KV_IF_ABSENT =
    "INSERT INTO app_data(key,value,updated_at) VALUES(?1,?2," SITESTORE_SQLITE_NOW_MS ")"
    " ON CONFLICT(key) DO NOTHING;";

static constexpr const char* INSERT_KV_IF_ABSENT_OWNED =
    "INSERT INTO app_data(key,value,user_id,updated_at) VALUES(?1,?2,?3," SITESTORE_SQLITE_NOW_MS ")"
    " ON CONFLICT(key,user_id) DO NOTHING;";

static constexpr const char* SELECT_KV =
    "SELECT key,value,updated_at FROM app_data WHERE key=?1;";

static constexpr const char* SELECT_KV_OWNED =
    "SELECT key,value,updated_at FROM app_data WHERE key=?1 AND user_id=?2;";

static constexpr const char* DELETE_KV =
    "DELETE FROM app_data WHERE key=?1;";

static constexpr const char* DELETE_KV_OWNED =
    "DELETE FROM app_data WHERE key=?1 AND user_id=?2;";

// case_sensitive_like is enabled per connection (SqliteDB::Configure)
static constexpr const char* LIST_KV_KEYS =
    "SELECT key FROM app_data WHERE key LIKE ?1 ESCAPE '\\' ORDER BY key DESC;";

static constexpr const char* LIST_KV_KEYS_OWNED =
    "SELECT key FROM app_data WHERE key LIKE ?1 ESCAPE '\\' AND user_id=?2 ORDER BY key DESC;";

// audit

static constexpr const char* INSERT_AUDIT =
    "INSERT INTO user_logs(event,details) VALUES(?1,?2);";

static constexpr const char* INSERT_AUDIT_OWNED =
    "INSERT INTO user_logs(event,details,user_id) VALUES(?1,?2,?3);";

// capabilities

static constexpr const char* SELECT_CAPABILITY_MARKER =
    "SELECT kv_owner_column,audit_owner_column FROM sitestore_schema_version WHERE id=1;";

static constexpr const char* SELECT_OWNER_COLUMNS =
    "SELECT 'app_data' FROM pragma_table_info('app_data') WHERE name='user_id'"
    " UNION ALL SELECT 'user_logs' FROM pragma_table_info('user_logs') WHERE name='user_id';";

#undef SITESTORE_SQLITE_NOW_MS

} // namespace sitestore::db::sql
