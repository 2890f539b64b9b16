#pragma once

#include "internal/db/api/kv_repository.hpp"
#include "internal/db/api/types.hpp"

namespace sitestore::db {

/*
  One-shot capability negotiation, run by the composition root before any
  component is built.

  Never throws: a failing probe is logged and yields the default
  (unscoped) capabilities, so the store keeps working against the
  narrower schema.
*/
SchemaCapabilities NegotiateCapabilities(KvRepository& repository);

} // namespace sitestore::db
