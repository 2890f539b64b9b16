#pragma once

#include <memory>
#include <optional>

#include "config/config.pb.h"

#include "internal/audit/event_sink.hpp"
#include "internal/auth/auth_service.hpp"
#include "internal/auth/credential_manager.hpp"
#include "internal/auth/session_tokens.hpp"
#include "internal/db/api/kv_repository.hpp"
#include "internal/kv/kv_store.hpp"
#include "internal/service/store_context.hpp"

namespace sitestore::factory {

/*
  RuntimeDependencies

  Owns all long-lived components. Everything here lives for the lifetime
  of the process.
*/
struct RuntimeDependencies {
  std::shared_ptr<db::KvRepository> repository;
  service::StoreContext             context;

  std::shared_ptr<kv::KvStore>               kv_store;
  std::shared_ptr<audit::EventSink>          events;
  std::shared_ptr<auth::CredentialManager>   credentials;
  std::shared_ptr<auth::SessionTokenService> tokens;
  std::shared_ptr<auth::AuthService>         auth;

  // Set when administrator seeding ran and succeeded.
  std::optional<auth::EnsureOutcome> seed_outcome;
};

/*
  BuildRuntime

  Selects and bootstraps the backend, negotiates schema capabilities,
  builds every component and seeds the administrative principal.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.

  Throws when the backend cannot be opened. Capability and seeding
  failures are absorbed.
*/
RuntimeDependencies BuildRuntime(const sitestore::runtime::config::RuntimeConfig& config);

// Builds components over an existing repository (no bootstrap, no seeding).
RuntimeDependencies BuildRuntime(const sitestore::runtime::config::RuntimeConfig& config,
                                 std::shared_ptr<db::KvRepository> repository);

// Runs EnsurePrincipal when identifier and password are configured.
// Failures are logged, recorded as admin_seed_failed and absorbed.
std::optional<auth::EnsureOutcome> SeedAdministrator(const RuntimeDependencies& deps,
                                                     const sitestore::runtime::config::AuthConfig& auth_config);

} // namespace sitestore::factory
