#include "beacon/storage/sqlite/sqlite_db.h"

#include <sqlite3.h>

namespace beacon::storage::sqlite {

void SqliteDb::SqliteDeleter::operator()(sqlite3* db) const {
  if (db != nullptr) {
    sqlite3_close(db);
  }
}

void PreparedStatement::StmtDeleter::operator()(sqlite3_stmt* stmt) const {
  if (stmt != nullptr) {
    sqlite3_finalize(stmt);
  }
}

// Embedded schema v1 SQL
constexpr const char* kSchemaV1 = R"(
PRAGMA foreign_keys = ON;

CREATE TABLE IF NOT EXISTS schema_version (
  version INTEGER PRIMARY KEY,
  applied_at TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS providers (
  provider_id TEXT PRIMARY KEY,
  name TEXT NOT NULL,
  current_role TEXT NOT NULL,
  current_employer TEXT NOT NULL,
  current_industry TEXT NOT NULL,
  location TEXT NOT NULL,
  alma_mater TEXT,
  help_offered_json TEXT NOT NULL,
  help_details TEXT NOT NULL,
  pref_location INTEGER CHECK(pref_location BETWEEN 1 AND 5),
  pref_alma_mater INTEGER CHECK(pref_alma_mater BETWEEN 1 AND 5),
  pref_gpa INTEGER CHECK(pref_gpa BETWEEN 1 AND 5),
  pref_industry INTEGER CHECK(pref_industry BETWEEN 1 AND 5),
  pref_help_type INTEGER CHECK(pref_help_type BETWEEN 1 AND 5),
  pref_path_alignment INTEGER CHECK(pref_path_alignment BETWEEN 1 AND 5)
);

CREATE TABLE IF NOT EXISTS seekers (
  seeker_id TEXT PRIMARY KEY,
  name TEXT NOT NULL,
  current_role TEXT NOT NULL,
  current_employer TEXT NOT NULL,
  current_industry TEXT NOT NULL,
  location TEXT NOT NULL,
  help_needed_json TEXT NOT NULL,
  gpa REAL CHECK(gpa IS NULL OR (gpa >= 0 AND gpa <= 4)),
  goal TEXT NOT NULL,
  context TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS past_positions (
  owner_kind TEXT NOT NULL CHECK(owner_kind IN ('provider', 'seeker')),
  owner_id TEXT NOT NULL,
  idx INTEGER NOT NULL,
  sort_order INTEGER NOT NULL,
  title TEXT NOT NULL,
  organization TEXT NOT NULL,
  duration TEXT NOT NULL,
  is_education INTEGER NOT NULL CHECK(is_education IN (0, 1)),
  PRIMARY KEY(owner_kind, owner_id, idx)
);

CREATE TABLE IF NOT EXISTS connections (
  provider_id TEXT NOT NULL,
  seeker_id TEXT NOT NULL,
  status TEXT NOT NULL CHECK(status IN ('pending', 'accepted', 'declined')),
  provider_score REAL NOT NULL,
  seeker_score REAL NOT NULL,
  bilateral_score REAL NOT NULL,
  created_at TEXT NOT NULL,
  provider_decided_at TEXT,
  seeker_decided_at TEXT,
  PRIMARY KEY(provider_id, seeker_id)
);

CREATE INDEX IF NOT EXISTS idx_connections_seeker ON connections(seeker_id);

CREATE TABLE IF NOT EXISTS audit_events (
  event_id TEXT PRIMARY KEY,
  trace_id TEXT NOT NULL,
  event_type TEXT NOT NULL,
  payload TEXT NOT NULL,
  created_at TEXT NOT NULL,
  entity_ids_json TEXT NOT NULL,
  idx INTEGER NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_audit_events_trace ON audit_events(trace_id, idx);

INSERT OR IGNORE INTO schema_version (version, applied_at)
VALUES (1, datetime('now'));
)";

// Embedded schema v2 SQL (goal alignment on connections; GPA keeps only a
// lower bound, weighted scales above 4.0 are clamped when scored)
constexpr const char* kSchemaV2 = R"(
BEGIN;

ALTER TABLE connections ADD COLUMN goal_alignment REAL
  CHECK(goal_alignment IS NULL OR (goal_alignment >= 0 AND goal_alignment <= 1));

CREATE TABLE seekers_v2 (
  seeker_id TEXT PRIMARY KEY,
  name TEXT NOT NULL,
  current_role TEXT NOT NULL,
  current_employer TEXT NOT NULL,
  current_industry TEXT NOT NULL,
  location TEXT NOT NULL,
  help_needed_json TEXT NOT NULL,
  gpa REAL CHECK(gpa IS NULL OR gpa >= 0),
  goal TEXT NOT NULL,
  context TEXT NOT NULL
);

INSERT INTO seekers_v2
  SELECT seeker_id, name, current_role, current_employer, current_industry, location,
         help_needed_json, gpa, goal, context
    FROM seekers;

DROP TABLE seekers;
ALTER TABLE seekers_v2 RENAME TO seekers;

INSERT OR IGNORE INTO schema_version (version, applied_at)
VALUES (2, datetime('now'));

COMMIT;
)";

SqliteDb::SqliteDb(sqlite3* db) : db_(db) {}

core::Result<std::shared_ptr<SqliteDb>, std::string> SqliteDb::open(const std::string& path) {
  sqlite3* db = nullptr;
  const int rc = sqlite3_open(path.c_str(), &db);
  if (rc != SQLITE_OK) {
    std::string error = db != nullptr ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    return core::Result<std::shared_ptr<SqliteDb>, std::string>::err("Failed to open database: " +
                                                                     error);
  }

  auto instance = std::shared_ptr<SqliteDb>(new SqliteDb(db));

  auto fk_result = instance->exec("PRAGMA foreign_keys = ON;");
  if (!fk_result.has_value()) {
    return core::Result<std::shared_ptr<SqliteDb>, std::string>::err(fk_result.error());
  }

  return core::Result<std::shared_ptr<SqliteDb>, std::string>::ok(instance);
}

int SqliteDb::get_schema_version() const {
  PreparedStatement table_stmt(
      db_.get(), "SELECT name FROM sqlite_master WHERE type='table' AND name='schema_version'");
  if (!table_stmt.is_valid() || sqlite3_step(table_stmt.get()) != SQLITE_ROW) {
    return 0;
  }

  PreparedStatement stmt(db_.get(), "SELECT MAX(version) FROM schema_version");
  if (!stmt.is_valid()) {
    return 0;
  }

  int version = 0;
  if (sqlite3_step(stmt.get()) == SQLITE_ROW &&
      sqlite3_column_type(stmt.get(), 0) != SQLITE_NULL) {
    version = sqlite3_column_int(stmt.get(), 0);
  }
  return version;
}

core::Result<bool, std::string> SqliteDb::ensure_schema_v1() {
  if (get_schema_version() >= 1) {
    return core::Result<bool, std::string>::ok(true);
  }

  char* err_msg = nullptr;
  const int rc = sqlite3_exec(db_.get(), kSchemaV1, nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = err_msg != nullptr ? err_msg : "Unknown error";
    sqlite3_free(err_msg);
    return core::Result<bool, std::string>::err("Failed to apply schema v1: " + error);
  }

  return core::Result<bool, std::string>::ok(true);
}

core::Result<bool, std::string> SqliteDb::ensure_schema_v2() {
  auto v1_result = ensure_schema_v1();
  if (!v1_result.has_value()) {
    return v1_result;
  }

  if (get_schema_version() >= 2) {
    return core::Result<bool, std::string>::ok(true);
  }

  char* err_msg = nullptr;
  const int rc = sqlite3_exec(db_.get(), kSchemaV2, nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = err_msg != nullptr ? err_msg : "Unknown error";
    sqlite3_free(err_msg);
    // The migration stops at the failing statement with its transaction open.
    if (sqlite3_get_autocommit(db_.get()) == 0) {
      auto rollback = exec("ROLLBACK;");
      if (!rollback.has_value()) {
        error += "; " + rollback.error();
      }
    }
    return core::Result<bool, std::string>::err("Failed to apply schema v2: " + error);
  }

  return core::Result<bool, std::string>::ok(true);
}

core::Result<bool, std::string> SqliteDb::exec(const std::string& sql) {
  char* err_msg = nullptr;
  const int rc = sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = err_msg != nullptr ? err_msg : "Unknown error";
    sqlite3_free(err_msg);
    return core::Result<bool, std::string>::err("SQL execution failed: " + error);
  }

  return core::Result<bool, std::string>::ok(true);
}

PreparedStatement::PreparedStatement(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* raw_stmt = nullptr;
  const int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &raw_stmt, nullptr);
  if (rc != SQLITE_OK) {
    error_ = sqlite3_errmsg(db);
    sqlite3_finalize(raw_stmt);
  } else {
    stmt_.reset(raw_stmt);
  }
}

void PreparedStatement::bind_text(int index, const std::string& value) {
  sqlite3_bind_text(stmt_.get(), index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void PreparedStatement::bind_optional_text(int index, const std::optional<std::string>& value) {
  if (value.has_value()) {
    bind_text(index, *value);
  } else {
    sqlite3_bind_null(stmt_.get(), index);
  }
}

void PreparedStatement::bind_int(int index, int value) {
  sqlite3_bind_int(stmt_.get(), index, value);
}

void PreparedStatement::bind_optional_int(int index, const std::optional<int>& value) {
  if (value.has_value()) {
    bind_int(index, *value);
  } else {
    sqlite3_bind_null(stmt_.get(), index);
  }
}

void PreparedStatement::bind_double(int index, double value) {
  sqlite3_bind_double(stmt_.get(), index, value);
}

void PreparedStatement::bind_optional_double(int index, const std::optional<double>& value) {
  if (value.has_value()) {
    bind_double(index, *value);
  } else {
    sqlite3_bind_null(stmt_.get(), index);
  }
}

std::string PreparedStatement::column_text(int index) const {
  const auto* raw = sqlite3_column_text(stmt_.get(), index);
  return raw != nullptr ? reinterpret_cast<const char*>(raw) : "";  // NOLINT
}

std::optional<std::string> PreparedStatement::column_optional_text(int index) const {
  if (sqlite3_column_type(stmt_.get(), index) == SQLITE_NULL) {
    return std::nullopt;
  }
  return column_text(index);
}

std::optional<int> PreparedStatement::column_optional_int(int index) const {
  if (sqlite3_column_type(stmt_.get(), index) == SQLITE_NULL) {
    return std::nullopt;
  }
  return sqlite3_column_int(stmt_.get(), index);
}

std::optional<double> PreparedStatement::column_optional_double(int index) const {
  if (sqlite3_column_type(stmt_.get(), index) == SQLITE_NULL) {
    return std::nullopt;
  }
  return sqlite3_column_double(stmt_.get(), index);
}

void PreparedStatement::reset() {
  if (stmt_) {
    sqlite3_reset(stmt_.get());
    sqlite3_clear_bindings(stmt_.get());
  }
}

}  // namespace beacon::storage::sqlite
