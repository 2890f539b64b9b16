#include "internal/audit/repository_event_log.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using sitestore::db::memory::MemoryKvRepository;

class ThrowingAuditRepository final : public MemoryKvRepository {
public:
  sitestore::db::Result AppendAudit(const sitestore::db::OwnerScope&, const sitestore::db::model::AuditRecord&) override {
    throw sitestore::util::BackendUnavailable("connection reset");
  }
};

class RejectingAuditRepository final : public MemoryKvRepository {
public:
  sitestore::db::Result AppendAudit(const sitestore::db::OwnerScope&, const sitestore::db::model::AuditRecord&) override {
    return sitestore::db::Result::Err(sitestore::db::ErrorCode::ConstraintViolation, "details must be an object");
  }
};

void TestEventsAreAppended() {
  auto                                repository = std::make_shared<MemoryKvRepository>();
  sitestore::audit::RepositoryEventLog log(repository, {});

  log.Record("admin_post_saved", sitestore::kv::MakeObject({{"slug", sitestore::kv::MakeString("hello")}}));

  const auto trail = repository->AuditTrail();
  assert(trail.size() == 1);
  assert(trail[0].record.event == "admin_post_saved");
  assert(!trail[0].owner_id);

  const auto details = sitestore::kv::FromJson(trail[0].record.details_json);
  assert(sitestore::kv::GetString(details, "slug") == "hello");
}

void TestNonObjectDetailsAreWrapped() {
  auto                                repository = std::make_shared<MemoryKvRepository>();
  sitestore::audit::RepositoryEventLog log(repository, {});

  log.Record("note", sitestore::kv::MakeString("plain"));

  const auto details = sitestore::kv::FromJson(repository->AuditTrail().at(0).record.details_json);
  assert(sitestore::kv::GetString(details, "value") == "plain");
}

void TestAuditScopeFollowsCapabilities() {
  auto                             repository = std::make_shared<MemoryKvRepository>();
  sitestore::service::StoreContext ctx;
  ctx.capabilities.audit_owner_column = true;
  ctx.owner_id                        = "site-a";

  sitestore::audit::RepositoryEventLog log(repository, ctx);
  log.Record("login_success", sitestore::kv::MakeObject({}));

  assert(repository->AuditTrail().at(0).owner_id == "site-a");
}

void TestFailingBackendNeverThrows() {
  sitestore::audit::RepositoryEventLog throwing(std::make_shared<ThrowingAuditRepository>(), {});
  throwing.Record("login_failed", sitestore::kv::MakeObject({}));

  sitestore::audit::RepositoryEventLog rejecting(std::make_shared<RejectingAuditRepository>(), {});
  rejecting.Record("login_failed", sitestore::kv::MakeObject({}));

  static_assert(noexcept(throwing.Record("x", sitestore::kv::Value{})));
}

} // namespace

int main() {
  TestEventsAreAppended();
  TestNonObjectDetailsAreWrapped();
  TestAuditScopeFollowsCapabilities();
  TestFailingBackendNeverThrows();

  std::cout << "sitestore_unit_event_log: pass\n";
  return 0;
}
