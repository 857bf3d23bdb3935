#pragma once

#include "beacon/storage/repositories.h"

#include <map>
#include <mutex>

namespace beacon::storage {

// InMemoryProfileRepository keeps profiles in std::map, so listing order is by id.
class InMemoryProfileRepository final : public IProfileRepository {
 public:
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
  mutable std::mutex mutex_;
  std::map<core::ProviderId, domain::Provider> providers_;
  std::map<core::SeekerId, domain::Seeker> seekers_;
};

}  // namespace beacon::storage
