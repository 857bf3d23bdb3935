#pragma once

#include "beacon/storage/repositories.h"
#include "beacon/storage/sqlite/sqlite_db.h"

#include <memory>

namespace beacon::storage::sqlite {

// SqliteProfileRepository stores providers and seekers relationally:
// one row per profile plus one row per past position.
class SqliteProfileRepository final : public IProfileRepository {
 public:
  explicit SqliteProfileRepository(std::shared_ptr<SqliteDb> db);

  [[nodiscard]] core::Result<bool, core::StorageError> upsert_provider(
      const domain::Provider& provider) override;
  [[nodiscard]] core::Result<bool, core::StorageError> upsert_seeker(
      const domain::Seeker& seeker) override;

  [[nodiscard]] std::optional<domain::Provider> get_provider(
      const core::ProviderId& id) const override;
  [[nodiscard]] std::optional<domain::Seeker> get_seeker(const core::SeekerId& id) const override;

  [[nodiscard]] std::vector<domain::Provider> list_providers() const override;
  [[nodiscard]] std::vector<domain::Seeker> list_seekers() const override;

 private:
  [[nodiscard]] bool replace_positions(const char* owner_kind, const std::string& owner_id,
                                       const std::vector<domain::PastPosition>& positions);
  [[nodiscard]] std::vector<domain::PastPosition> load_positions(const char* owner_kind,
                                                                 const std::string& owner_id) const;

  std::shared_ptr<SqliteDb> db_;
};

}  // namespace beacon::storage::sqlite
