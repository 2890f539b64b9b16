#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace sitestore::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  Statements are owned through Statement, which finalizes on every exit path.
*/
class SqliteDB {
 public:
  struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const {
      sqlite3_finalize(stmt);
    }
  };
  using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations); throws util::BackendError
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, case-sensitive LIKE, etc.)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace sitestore::db::sqlite
