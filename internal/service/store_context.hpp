#pragma once

#include <string>

#include "internal/db/api/types.hpp"

namespace sitestore::service {

/*
  Immutable per-process storage context shared by all components.

  Built once by the composition root after capability negotiation and
  copied into each component; nothing mutates it afterwards.
*/
struct StoreContext {
  db::SchemaCapabilities capabilities;
  std::string            owner_id;

  db::OwnerScope KvScope() const {
    return capabilities.kv_owner_column ? db::OwnerScope::Owner(owner_id) : db::OwnerScope::Unscoped();
  }

  db::OwnerScope AuditScope() const {
    return capabilities.audit_owner_column ? db::OwnerScope::Owner(owner_id) : db::OwnerScope::Unscoped();
  }
};

} // namespace sitestore::service
