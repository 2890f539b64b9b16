#include "repository_event_log.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace sitestore::audit {

RepositoryEventLog::RepositoryEventLog(std::shared_ptr<db::KvRepository> repository, service::StoreContext context)
    : repository_(std::move(repository)), context_(std::move(context)) {
}

void RepositoryEventLog::Record(const std::string& event, const kv::Value& details) noexcept {
  try {
    db::model::AuditRecord record;
    record.event        = event;
    record.details_json = kv::ToJson(details.kind_case() == kv::Value::kStructValue ? details : kv::MakeObject({{"value", details}}));

    const auto result = repository_->AppendAudit(context_.AuditScope(), record);
    if (!result) {
      SITESTORE_LOG_WARN("audit write failed", {observability::StringField("event", event), observability::StringField("error", result.message)});
    }
  } catch (const std::exception& e) {
    SITESTORE_LOG_WARN("audit write failed", {observability::StringField("event", event), observability::StringField("error", e.what())});
  } catch (...) {
    SITESTORE_LOG_WARN("audit write failed", {observability::StringField("event", event), observability::StringField("error", "unknown exception")});
  }
}

} // namespace sitestore::audit
