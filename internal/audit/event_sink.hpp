#pragma once

#include <string>

#include "internal/kv/value.hpp"

namespace sitestore::audit {

/*
  Best-effort audit sink.

  Record never throws and has no failure return; an implementation that
  cannot persist the event reports it through the process log only.
*/
class EventSink {
public:
  virtual ~EventSink() = default;

  // details is expected to be an object value; anything else is wrapped as {"value": details}.
  virtual void Record(const std::string& event, const kv::Value& details) noexcept = 0;
};

} // namespace sitestore::audit
