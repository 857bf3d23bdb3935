#pragma once

#include "beacon/storage/audit_log.h"
#include "beacon/storage/sqlite/sqlite_db.h"

#include <map>
#include <memory>
#include <mutex>

namespace beacon::storage::sqlite {

// SqliteAuditLog persists events with a per-trace sequence number (idx) so
// query() returns them in append order across process restarts.
class SqliteAuditLog final : public IAuditLog {
 public:
  explicit SqliteAuditLog(std::shared_ptr<SqliteDb> db);

  void append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;

 private:
  int next_index(const std::string& trace_id);

  std::shared_ptr<SqliteDb> db_;
  mutable std::mutex mutex_;
  std::map<std::string, int> trace_indices_;
};

}  // namespace beacon::storage::sqlite
