#include "beacon/storage/sqlite/sqlite_audit_log.h"

#include <nlohmann/json.hpp>

#include <iostream>

#include <sqlite3.h>

namespace beacon::storage::sqlite {

SqliteAuditLog::SqliteAuditLog(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

void SqliteAuditLog::append(const AuditEvent& event) {
  const int idx = next_index(event.trace_id);

  // Serialize refs to JSON array
  const nlohmann::json refs_json = event.refs;

  const char* sql = R"(
    INSERT INTO audit_events
      (event_id, trace_id, event_type, payload, created_at, entity_ids_json, idx)
    VALUES (?, ?, ?, ?, ?, ?, ?)
  )";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    std::cerr << "WARNING: audit append failed: " << stmt.error() << "\n";
    return;
  }

  stmt.bind_text(1, event.event_id);
  stmt.bind_text(2, event.trace_id);
  stmt.bind_text(3, event.event_type);
  stmt.bind_text(4, event.payload);
  stmt.bind_text(5, event.created_at);
  stmt.bind_text(6, refs_json.dump());
  stmt.bind_int(7, idx);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    std::cerr << "WARNING: audit append failed: " << sqlite3_errmsg(db_->connection()) << "\n";
  }
}

std::vector<AuditEvent> SqliteAuditLog::query(const std::string& trace_id) const {
  std::string sql =
      "SELECT event_id, trace_id, event_type, payload, created_at, entity_ids_json"
      "  FROM audit_events";
  sql += trace_id.empty() ? " ORDER BY rowid" : " WHERE trace_id = ? ORDER BY idx";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return {};
  }
  if (!trace_id.empty()) {
    stmt.bind_text(1, trace_id);
  }

  std::vector<AuditEvent> result;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    AuditEvent event;
    event.event_id = stmt.column_text(0);
    event.trace_id = stmt.column_text(1);
    event.event_type = stmt.column_text(2);
    event.payload = stmt.column_text(3);
    event.created_at = stmt.column_text(4);

    try {
      event.refs = nlohmann::json::parse(stmt.column_text(5)).get<std::vector<std::string>>();
    } catch (const nlohmann::json::exception& e) {
      std::cerr << "WARNING: unreadable refs on audit event " << event.event_id << ": " << e.what()
                << "\n";
    }

    result.push_back(std::move(event));
  }

  return result;
}

int SqliteAuditLog::next_index(const std::string& trace_id) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = trace_indices_.find(trace_id);
  if (it != trace_indices_.end()) {
    return it->second++;
  }

  // New trace in this process: continue after whatever is already stored
  int max_idx = -1;
  PreparedStatement stmt(db_->connection(), "SELECT MAX(idx) FROM audit_events WHERE trace_id = ?");
  if (stmt.is_valid()) {
    stmt.bind_text(1, trace_id);
    if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
      max_idx = stmt.column_optional_int(0).value_or(-1);
    }
  }

  const int idx = max_idx + 1;
  trace_indices_[trace_id] = idx + 1;
  return idx;
}

}  // namespace beacon::storage::sqlite
