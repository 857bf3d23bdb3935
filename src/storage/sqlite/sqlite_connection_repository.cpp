#include "beacon/storage/sqlite/sqlite_connection_repository.h"

#include <sqlite3.h>

#include <utility>

namespace beacon::storage::sqlite {

namespace {

constexpr const char* kSelectColumns = R"(
    SELECT provider_id, seeker_id, status, provider_score, seeker_score, bilateral_score,
           goal_alignment, created_at, provider_decided_at, seeker_decided_at
      FROM connections )";

domain::Connection read_connection_row(const PreparedStatement& stmt) {
  domain::Connection connection;
  connection.provider_id = core::ProviderId{stmt.column_text(0)};
  connection.seeker_id = core::SeekerId{stmt.column_text(1)};
  connection.status =
      domain::parse_connection_status(stmt.column_text(2)).value_or(domain::ConnectionStatus::kPending);
  connection.provider_score = sqlite3_column_double(stmt.get(), 3);
  connection.seeker_score = sqlite3_column_double(stmt.get(), 4);
  connection.bilateral_score = sqlite3_column_double(stmt.get(), 5);
  connection.goal_alignment = stmt.column_optional_double(6);
  connection.created_at = stmt.column_text(7);
  connection.provider_decided_at = stmt.column_optional_text(8);
  connection.seeker_decided_at = stmt.column_optional_text(9);
  return connection;
}

using ConnectionList = core::Result<std::vector<domain::Connection>, core::StorageError>;

// Steps stmt to completion. A step error fails the whole read.
ConnectionList read_connection_rows(PreparedStatement& stmt) {
  std::vector<domain::Connection> rows;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    rows.push_back(read_connection_row(stmt));
  }
  if (rc != SQLITE_DONE) {
    return ConnectionList::err(core::StorageError::kUnavailable);
  }
  return ConnectionList::ok(std::move(rows));
}

}  // namespace

SqliteConnectionRepository::SqliteConnectionRepository(std::shared_ptr<SqliteDb> db)
    : db_(std::move(db)) {}

core::Result<bool, core::StorageError> SqliteConnectionRepository::insert(
    const domain::Connection& connection) {
  using R = core::Result<bool, core::StorageError>;

  const char* sql = R"(
    INSERT INTO connections
      (provider_id, seeker_id, status, provider_score, seeker_score, bilateral_score,
       goal_alignment, created_at, provider_decided_at, seeker_decided_at)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
  )";
  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return R::err(core::StorageError::kUnavailable);
  }

  stmt.bind_text(1, connection.provider_id.value);
  stmt.bind_text(2, connection.seeker_id.value);
  stmt.bind_text(3, std::string(domain::to_string(connection.status)));
  stmt.bind_double(4, connection.provider_score);
  stmt.bind_double(5, connection.seeker_score);
  stmt.bind_double(6, connection.bilateral_score);
  stmt.bind_optional_double(7, connection.goal_alignment);
  stmt.bind_text(8, connection.created_at);
  stmt.bind_optional_text(9, connection.provider_decided_at);
  stmt.bind_optional_text(10, connection.seeker_decided_at);

  const int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_CONSTRAINT) {
    return R::err(core::StorageError::kConflict);
  }
  if (rc != SQLITE_DONE) {
    return R::err(core::StorageError::kUnavailable);
  }
  return R::ok(true);
}

core::Result<bool, core::StorageError> SqliteConnectionRepository::update(
    const domain::Connection& connection) {
  using R = core::Result<bool, core::StorageError>;

  const char* sql = R"(
    UPDATE connections
       SET status = ?, provider_score = ?, seeker_score = ?, bilateral_score = ?,
           goal_alignment = ?, provider_decided_at = ?, seeker_decided_at = ?
     WHERE provider_id = ? AND seeker_id = ?
  )";
  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return R::err(core::StorageError::kUnavailable);
  }

  stmt.bind_text(1, std::string(domain::to_string(connection.status)));
  stmt.bind_double(2, connection.provider_score);
  stmt.bind_double(3, connection.seeker_score);
  stmt.bind_double(4, connection.bilateral_score);
  stmt.bind_optional_double(5, connection.goal_alignment);
  stmt.bind_optional_text(6, connection.provider_decided_at);
  stmt.bind_optional_text(7, connection.seeker_decided_at);
  stmt.bind_text(8, connection.provider_id.value);
  stmt.bind_text(9, connection.seeker_id.value);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return R::err(core::StorageError::kUnavailable);
  }
  if (sqlite3_changes(db_->connection()) == 0) {
    return R::err(core::StorageError::kNotFound);
  }
  return R::ok(true);
}

core::Result<std::optional<domain::Connection>, core::StorageError>
SqliteConnectionRepository::get(const core::ProviderId& provider_id,
                                const core::SeekerId& seeker_id) const {
  using R = core::Result<std::optional<domain::Connection>, core::StorageError>;

  PreparedStatement stmt(db_->connection(),
                         std::string(kSelectColumns) + "WHERE provider_id = ? AND seeker_id = ?");
  if (!stmt.is_valid()) {
    return R::err(core::StorageError::kUnavailable);
  }
  stmt.bind_text(1, provider_id.value);
  stmt.bind_text(2, seeker_id.value);

  const int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_DONE) {
    return R::ok(std::nullopt);
  }
  if (rc != SQLITE_ROW) {
    return R::err(core::StorageError::kUnavailable);
  }
  return R::ok(read_connection_row(stmt));
}

core::Result<std::vector<domain::Connection>, core::StorageError>
SqliteConnectionRepository::list_for_provider(const core::ProviderId& provider_id) const {
  PreparedStatement stmt(db_->connection(),
                         std::string(kSelectColumns) + "WHERE provider_id = ? ORDER BY seeker_id");
  if (!stmt.is_valid()) {
    return ConnectionList::err(core::StorageError::kUnavailable);
  }
  stmt.bind_text(1, provider_id.value);
  return read_connection_rows(stmt);
}

core::Result<std::vector<domain::Connection>, core::StorageError>
SqliteConnectionRepository::list_for_seeker(const core::SeekerId& seeker_id) const {
  PreparedStatement stmt(db_->connection(),
                         std::string(kSelectColumns) + "WHERE seeker_id = ? ORDER BY provider_id");
  if (!stmt.is_valid()) {
    return ConnectionList::err(core::StorageError::kUnavailable);
  }
  stmt.bind_text(1, seeker_id.value);
  return read_connection_rows(stmt);
}

core::Result<std::set<core::SeekerId>, core::StorageError>
SqliteConnectionRepository::contacted_seekers(const core::ProviderId& provider_id) const {
  using R = core::Result<std::set<core::SeekerId>, core::StorageError>;

  PreparedStatement stmt(db_->connection(),
                         "SELECT seeker_id FROM connections WHERE provider_id = ?");
  if (!stmt.is_valid()) {
    return R::err(core::StorageError::kUnavailable);
  }
  stmt.bind_text(1, provider_id.value);

  std::set<core::SeekerId> ids;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    ids.insert(core::SeekerId{stmt.column_text(0)});
  }
  if (rc != SQLITE_DONE) {
    return R::err(core::StorageError::kUnavailable);
  }
  return R::ok(std::move(ids));
}

}  // namespace beacon::storage::sqlite
