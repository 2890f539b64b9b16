#pragma once

#include <memory>

#include "internal/audit/event_sink.hpp"
#include "internal/db/api/kv_repository.hpp"
#include "internal/service/store_context.hpp"

namespace sitestore::audit {

// Appends events to user_logs, scoped by owner when the schema carries the column.
class RepositoryEventLog final : public EventSink {
public:
  RepositoryEventLog(std::shared_ptr<db::KvRepository> repository, service::StoreContext context);

  void Record(const std::string& event, const kv::Value& details) noexcept override;

private:
  std::shared_ptr<db::KvRepository> repository_;
  service::StoreContext             context_;
};

} // namespace sitestore::audit
