#pragma once

#include "beacon/storage/audit_event.h"

#include <mutex>
#include <string>
#include <vector>

namespace beacon::storage {

class IAuditLog {
 public:
  virtual ~IAuditLog() = default;
  virtual void append(const AuditEvent& event) = 0;
  // Events for trace_id in append order. An empty trace_id returns every event.
  [[nodiscard]] virtual std::vector<AuditEvent> query(const std::string& trace_id) const = 0;
};

class InMemoryAuditLog final : public IAuditLog {
 public:
  void append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;

 private:
  mutable std::mutex mutex_;
  std::vector<AuditEvent> events_;
};

}  // namespace beacon::storage
