#pragma once

#include "beacon/storage/repositories.h"

#include <map>
#include <mutex>
#include <utility>

namespace beacon::storage {

class InMemoryConnectionRepository final : public IConnectionRepository {
 public:
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
  using Key = std::pair<core::ProviderId, core::SeekerId>;

  mutable std::mutex mutex_;
  std::map<Key, domain::Connection> connections_;
};

}  // namespace beacon::storage
