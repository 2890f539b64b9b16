#include "internal/factory.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using sitestore::db::memory::MemoryKvRepository;
using sitestore::runtime::config::RuntimeConfig;

class UnreachableRepository final : public MemoryKvRepository {
public:
  std::optional<sitestore::db::model::KvRecord> Find(const sitestore::db::OwnerScope&, const std::string&) override {
    throw sitestore::util::BackendUnavailable("connection refused");
  }
};

RuntimeConfig BaseConfig() {
  RuntimeConfig config;
  config.mutable_auth()->set_admin_identifier("a@x.com");
  config.mutable_auth()->set_admin_password("pw123");
  sitestore::config::ConfigLoader::ApplyDefaults(config);
  return config;
}

void TestMemoryRuntimeSeedsAdministrator() {
  auto config = BaseConfig();
  auto deps   = sitestore::factory::BuildRuntime(config);

  assert(deps.seed_outcome == sitestore::auth::EnsureOutcome::kCreated);
  assert(deps.auth->Login("a@x.com", "pw123"));
  assert(deps.context.owner_id == "default");
  assert(!deps.context.capabilities.kv_owner_column);
}

void TestMemoryCapabilitiesComeFromConfig() {
  auto config = BaseConfig();
  config.mutable_database()->mutable_memory()->set_kv_owner_column(true);
  config.mutable_storage()->set_owner_id("site-a");

  auto deps = sitestore::factory::BuildRuntime(config);
  assert(deps.context.capabilities.kv_owner_column);
  assert(deps.kv_store->Context().KvScope().owner_id == "site-a");
}

void TestSeedingSkippedWithoutPassword() {
  auto config = BaseConfig();
  config.mutable_auth()->clear_admin_password();

  auto deps = sitestore::factory::BuildRuntime(config);
  assert(!deps.seed_outcome);
  assert(!deps.kv_store->Get(sitestore::auth::kPrincipalKey));
}

void TestSeedingFailureIsAbsorbedAndAudited() {
  auto config     = BaseConfig();
  auto repository = std::make_shared<UnreachableRepository>();
  auto deps       = sitestore::factory::BuildRuntime(config, repository);

  assert(!sitestore::factory::SeedAdministrator(deps, config.auth()));

  const auto trail = repository->AuditTrail();
  assert(trail.size() == 1);
  assert(trail[0].record.event == "admin_seed_failed");
}

#if SITESTORE_DB_SQLITE
void TestSqliteRuntimeBootstrapsScopedSchema() {
  const auto path = std::filesystem::temp_directory_path() / "sitestore_factory_test.sqlite";
  std::filesystem::remove(path);

  auto config   = BaseConfig();
  auto database = config.mutable_database();
  database->mutable_sqlite()->set_path(path.string());
  database->set_bootstrap_schema(true);
  database->set_owner_scoped_schema(true);

  {
    auto deps = sitestore::factory::BuildRuntime(config);
    assert(deps.context.capabilities.kv_owner_column);
    assert(deps.context.capabilities.audit_owner_column);
    assert(deps.seed_outcome == sitestore::auth::EnsureOutcome::kCreated);
  }

  // reopening finds the marker and the seeded principal
  {
    auto deps = sitestore::factory::BuildRuntime(config);
    assert(deps.context.capabilities.kv_owner_column);
    assert(deps.seed_outcome == sitestore::auth::EnsureOutcome::kAlreadyPresent);
  }

  std::filesystem::remove(path);
  std::filesystem::remove(path.string() + "-wal");
  std::filesystem::remove(path.string() + "-shm");
}
#endif

} // namespace

int main() {
  TestMemoryRuntimeSeedsAdministrator();
  TestMemoryCapabilitiesComeFromConfig();
  TestSeedingSkippedWithoutPassword();
  TestSeedingFailureIsAbsorbedAndAudited();
#if SITESTORE_DB_SQLITE
  TestSqliteRuntimeBootstrapsScopedSchema();
#endif

  std::cout << "sitestore_unit_factory: pass\n";
  return 0;
}
