#include "beacon/storage/audit_log.h"

namespace beacon::storage {

void InMemoryAuditLog::append(const AuditEvent& event) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(event);
}

std::vector<AuditEvent> InMemoryAuditLog::query(const std::string& trace_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (trace_id.empty()) {
    return events_;
  }

  std::vector<AuditEvent> filtered;
  for (const auto& event : events_) {
    if (event.trace_id == trace_id) {
      filtered.push_back(event);
    }
  }
  return filtered;
}

}  // namespace beacon::storage
