#include "sqlite_db.hpp"

#include "internal/util/errors.hpp"

namespace sitestore::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw util::BackendError(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::BackendUnavailable("sqlite open " + path_ + ": " + msg);
  }

  try {
    Configure();
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw util::BackendError(msg);
  }
}

void SqliteDB::Configure() {
  // WAL: readers proceed while a writer holds the lock
  Exec("PRAGMA journal_mode=WAL;");

  Exec("PRAGMA synchronous=NORMAL;");

  // prefix listing relies on byte-exact LIKE; sqlite folds ASCII case by default
  Exec("PRAGMA case_sensitive_like=ON;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace sitestore::db::sqlite
