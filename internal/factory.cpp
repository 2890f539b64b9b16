#include "factory.hpp"

#include <chrono>
#include <exception>
#include <stdexcept>

#include "internal/audit/repository_event_log.hpp"
#include "internal/db/capabilities.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#if SITESTORE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if SITESTORE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace sitestore::factory {

using sitestore::runtime::config::RuntimeConfig;

namespace {

std::shared_ptr<db::KvRepository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();

  if (database.has_sqlite()) {
#if SITESTORE_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    if (database.bootstrap_schema()) {
      db::sqlite::SqliteKvRepository::Bootstrap(*sqlite_db, database.owner_scoped_schema());
    }
    SITESTORE_LOG_INFO("sqlite backend opened", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteKvRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if SITESTORE_DB_POSTGRES
    const auto& pg = database.postgres();

    db::postgres::PgPoolOptions options;
    options.conninfo             = pg.connection_uri();
    options.schema               = pg.schema();
    options.max_connections      = pg.max_connections();
    options.acquire_timeout      = std::chrono::milliseconds(pg.acquire_timeout_ms());
    options.statement_timeout_ms = pg.statement_timeout_ms();

    auto pool = std::make_shared<db::postgres::PgPool>(std::move(options));
    if (database.bootstrap_schema()) {
      db::postgres::PgKvRepository::Bootstrap(*pool, database.owner_scoped_schema());
    }
    SITESTORE_LOG_INFO("postgres backend opened", {observability::StringField("schema", pg.schema()),
                                                   observability::IntField("max_connections", pg.max_connections())});
    return std::make_shared<db::postgres::PgKvRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  db::SchemaCapabilities caps;
  caps.kv_owner_column    = database.memory().kv_owner_column();
  caps.audit_owner_column = database.memory().audit_owner_column();
  SITESTORE_LOG_INFO("memory backend selected");
  return std::make_shared<db::memory::MemoryKvRepository>(caps);
}

} // namespace

RuntimeDependencies BuildRuntime(const RuntimeConfig& config, std::shared_ptr<db::KvRepository> repository) {
  RuntimeDependencies deps;
  deps.repository = std::move(repository);

  // ------------------------------------------------------------------
  // Capabilities (negotiated once, immutable afterwards)
  // ------------------------------------------------------------------
  deps.context.capabilities = db::NegotiateCapabilities(*deps.repository);
  deps.context.owner_id     = config.storage().owner_id();

  // ------------------------------------------------------------------
  // Components
  // ------------------------------------------------------------------
  const auto& auth_config = config.auth();

  deps.kv_store    = std::make_shared<kv::KvStore>(deps.repository, deps.context);
  deps.events      = std::make_shared<audit::RepositoryEventLog>(deps.repository, deps.context);
  deps.credentials = std::make_shared<auth::CredentialManager>(deps.kv_store, auth_config.pbkdf2_iterations());
  deps.tokens      = std::make_shared<auth::SessionTokenService>(deps.kv_store);
  deps.auth        = std::make_shared<auth::AuthService>(deps.credentials, deps.tokens, deps.events, auth_config.admin_identifier(),
                                                  std::chrono::milliseconds(auth_config.session_ttl_ms()));
  return deps;
}

RuntimeDependencies BuildRuntime(const RuntimeConfig& config) {
  auto deps         = BuildRuntime(config, BuildRepository(config));
  deps.seed_outcome = SeedAdministrator(deps, config.auth());
  return deps;
}

std::optional<auth::EnsureOutcome> SeedAdministrator(const RuntimeDependencies& deps,
                                                     const sitestore::runtime::config::AuthConfig& auth_config) {
  if (auth_config.admin_identifier().empty() || auth_config.admin_password().empty()) {
    SITESTORE_LOG_INFO("administrator seeding skipped; identifier or password not configured");
    return std::nullopt;
  }

  try {
    return deps.credentials->EnsurePrincipal(auth_config.admin_identifier(), auth_config.admin_password());
  } catch (const std::exception& e) {
    SITESTORE_LOG_ERROR("administrator seeding failed", {observability::StringField("error", e.what())});
    deps.events->Record("admin_seed_failed", kv::MakeObject({{"message", kv::MakeString(e.what())}}));
    return std::nullopt;
  }
}

} // namespace sitestore::factory
