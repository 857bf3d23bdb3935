#pragma once

#include "beacon/storage/repositories.h"
#include "beacon/storage/sqlite/sqlite_db.h"

#include <memory>

namespace beacon::storage::sqlite {

class SqliteConnectionRepository final : public IConnectionRepository {
 public:
  explicit SqliteConnectionRepository(std::shared_ptr<SqliteDb> db);

  [[nodiscard]] core::Result<bool, core::StorageError> insert(
      const domain::Connection& connection) override;
  [[nodiscard]] core::Result<bool, core::StorageError> update(
      const domain::Connection& connection) override;

  [[nodiscard]] core::Result<std::optional<domain::Connection>, core::StorageError> get(
      const core::ProviderId& provider_id, const core::SeekerId& seeker_id) const override;
  [[nodiscard]] core::Result<std::vector<domain::Connection>, core::StorageError>
  list_for_provider(const core::ProviderId& provider_id) const override;
  [[nodiscard]] core::Result<std::vector<domain::Connection>, core::StorageError> list_for_seeker(
      const core::SeekerId& seeker_id) const override;
  [[nodiscard]] core::Result<std::set<core::SeekerId>, core::StorageError> contacted_seekers(
      const core::ProviderId& provider_id) const override;

 private:
  std::shared_ptr<SqliteDb> db_;
};

}  // namespace beacon::storage::sqlite
