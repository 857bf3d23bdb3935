#pragma once

#include "beacon/core/result.h"

#include <memory>
#include <optional>
#include <string>

// Forward declare sqlite3 to keep the SQLite header out of the public API
struct sqlite3;
struct sqlite3_stmt;

namespace beacon::storage::sqlite {

// SqliteDb owns one SQLite connection and applies the embedded schema.
// - RAII: connection managed via unique_ptr with custom deleter
// - Explicit error handling via Result<T,E>
// - One connection per instance; statements on it are serialized by SQLite
class SqliteDb {
 public:
  // Open or create database at path. ":memory:" creates an in-memory database.
  [[nodiscard]] static core::Result<std::shared_ptr<SqliteDb>, std::string> open(
      const std::string& path);

  ~SqliteDb() = default;

  SqliteDb(const SqliteDb&) = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;
  SqliteDb(SqliteDb&&) = delete;
  SqliteDb& operator=(SqliteDb&&) = delete;

  // Current schema version (0 if no schema applied)
  [[nodiscard]] int get_schema_version() const;

  // Apply schema v1 if not already applied
  [[nodiscard]] core::Result<bool, std::string> ensure_schema_v1();

  // Apply v1 then v2 (connection goal alignment, open-ended GPA) if needed.
  // Repositories expect the v2 layout.
  [[nodiscard]] core::Result<bool, std::string> ensure_schema_v2();

  // Execute SQL statement (for non-query operations)
  [[nodiscard]] core::Result<bool, std::string> exec(const std::string& sql);

  // Raw connection, for repository implementations only
  [[nodiscard]] sqlite3* connection() const { return db_.get(); }

 private:
  struct SqliteDeleter {
    void operator()(sqlite3* db) const;
  };

  explicit SqliteDb(sqlite3* db);

  std::unique_ptr<sqlite3, SqliteDeleter> db_;
};

// RAII wrapper for prepared statements
class PreparedStatement {
 public:
  PreparedStatement(sqlite3* db, const std::string& sql);
  ~PreparedStatement() = default;

  PreparedStatement(const PreparedStatement&) = delete;
  PreparedStatement& operator=(const PreparedStatement&) = delete;
  PreparedStatement(PreparedStatement&&) = delete;
  PreparedStatement& operator=(PreparedStatement&&) = delete;

  [[nodiscard]] bool is_valid() const { return stmt_ != nullptr; }
  [[nodiscard]] std::string error() const { return error_; }
  [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }

  void bind_text(int index, const std::string& value);
  void bind_optional_text(int index, const std::optional<std::string>& value);
  void bind_int(int index, int value);
  void bind_optional_int(int index, const std::optional<int>& value);
  void bind_double(int index, double value);
  void bind_optional_double(int index, const std::optional<double>& value);

  // Column readers; NULL text reads as empty / nullopt.
  [[nodiscard]] std::string column_text(int index) const;
  [[nodiscard]] std::optional<std::string> column_optional_text(int index) const;
  [[nodiscard]] std::optional<int> column_optional_int(int index) const;
  [[nodiscard]] std::optional<double> column_optional_double(int index) const;

  // Reset statement for reuse
  void reset();

 private:
  struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const;
  };

  std::unique_ptr<sqlite3_stmt, StmtDeleter> stmt_;
  std::string error_;
};

}  // namespace beacon::storage::sqlite
