#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/audit_record.hpp"
#include "internal/db/model/kv_record.hpp"

namespace sitestore::db {

/*
  KvRepository abstraction.

  GUARANTEES for ALL backends:

  - Every call is a self-contained unit: it leases a connection,
    runs its statement(s) and releases the connection on every path
  - Upsert is a single statement with a conflict clause
  - InsertIfAbsent never overwrites an existing row
  - ListKeysWithPrefix matches the prefix literally, case-sensitively,
    and orders keys descending by byte value

  ERROR REPORTING:

  - writes return Result
  - reads throw util::BackendUnavailable / util::BackendError
  - a missing key is never an error
*/

class KvRepository {
 public:
  virtual ~KvRepository() = default;

  // ---------------------------------------------------------------------
  // Schema
  // ---------------------------------------------------------------------

  // Reads the capability marker, falling back to catalog introspection. Throws on failure.
  virtual SchemaCapabilities DetectCapabilities() = 0;

  // ---------------------------------------------------------------------
  // Key/value
  // ---------------------------------------------------------------------

  virtual Result Upsert(const OwnerScope&, const model::KvRecord&) = 0;

  // Ok if inserted, AlreadyExists if the key was present (row untouched).
  virtual Result InsertIfAbsent(const OwnerScope&, const model::KvRecord&) = 0;

  virtual std::optional<model::KvRecord> Find(const OwnerScope&, const std::string& key) = 0;

  virtual Result Delete(const OwnerScope&, const std::string& key) = 0;

  virtual std::vector<std::string> ListKeysWithPrefix(const OwnerScope&, const std::string& prefix) = 0;

  // ---------------------------------------------------------------------
  // Audit
  // ---------------------------------------------------------------------

  virtual Result AppendAudit(const OwnerScope&, const model::AuditRecord&) = 0;
};

} // namespace sitestore::db
