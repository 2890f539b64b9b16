#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace sitestore::db::postgres {

struct PgPoolOptions {
  std::string               conninfo;
  std::string               schema = "public";
  std::size_t               max_connections = 16;
  std::chrono::milliseconds acquire_timeout{5000};
  uint32_t                  statement_timeout_ms = 0; // 0 = server default
};

/*
  PgPool

  Bounded connection pool used by PgKvRepository.

  Design notes:
  -------------
  - Each repository call leases one connection for its whole duration.
  - libpqxx connections are NOT thread-safe → never shared between leases.
  - search_path and statement_timeout are installed once per connection.
  - Acquire() blocks at most acquire_timeout, then throws
    util::BackendUnavailable.
  - Connections found closed on release are dropped, not recycled.

  Lifetime:
    Repository owns shared_ptr<PgPool>
    Each call holds shared_ptr<pqxx::connection>; its deleter returns it
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(PgPoolOptions options);

  // Acquire a ready-to-use connection
  std::shared_ptr<pqxx::connection> Acquire();

  std::size_t LiveConnections() const;

 private:
  void                              ConfigureSession(pqxx::connection& conn) const;
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  PgPoolOptions options_;

  mutable std::mutex                             mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace sitestore::db::postgres
