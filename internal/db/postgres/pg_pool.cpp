#include "pg_pool.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace sitestore::db::postgres {

using sitestore::observability::StringField;

PgPool::PgPool(PgPoolOptions options) : options_(std::move(options)) {
  if (options_.max_connections == 0) {
    options_.max_connections = 1;
  }
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);

  const bool ready = cv_.wait_for(lock, options_.acquire_timeout, [this] {
    return !idle_.empty() || live_connections_ < options_.max_connections;
  });
  if (!ready) {
    throw util::BackendUnavailable("postgres: timed out waiting for a pooled connection");
  }

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(options_.conninfo);
  } catch (const std::exception& e) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw util::BackendUnavailable(std::string("postgres: connect failed: ") + e.what());
  }

  ConfigureSession(*conn);
  return Wrap(conn.release());
}

std::size_t PgPool::LiveConnections() const {
  std::lock_guard lock(mutex_);
  return live_connections_;
}

void PgPool::ConfigureSession(pqxx::connection& conn) const {
  // Failures here leave the server defaults in place; queries may still
  // resolve if the default schema already holds the tables.
  try {
    pqxx::nontransaction tx(conn);
    tx.exec_params("SELECT set_config($1, $2, false)", "search_path", options_.schema + ",public");
    if (options_.statement_timeout_ms > 0) {
      tx.exec_params("SELECT set_config($1, $2, false)", "statement_timeout", std::to_string(options_.statement_timeout_ms));
    }
    tx.commit();
  } catch (const std::exception& e) {
    SITESTORE_LOG_WARN("postgres session setup failed", {StringField("schema", options_.schema), StringField("error", e.what())});
  }
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = weak_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  std::unique_ptr<pqxx::connection> owned(conn);
  {
    std::lock_guard lock(mutex_);
    if (owned->is_open()) {
      idle_.push_back(std::move(owned));
    } else {
      --live_connections_;
    }
  }
  cv_.notify_one();
}

} // namespace sitestore::db::postgres
