#pragma once

#include "beacon/core/ids.h"
#include "beacon/core/result.h"
#include "beacon/domain/connection.h"
#include "beacon/domain/profile.h"

#include <optional>
#include <set>
#include <vector>

namespace beacon::storage {

// IProfileRepository serves provider and seeker records.
// list_* return records ordered by id so callers see a deterministic sequence.
class IProfileRepository {
 public:
  virtual ~IProfileRepository() = default;

  [[nodiscard]] virtual core::Result<bool, core::StorageError> upsert_provider(
      const domain::Provider& provider) = 0;
  [[nodiscard]] virtual core::Result<bool, core::StorageError> upsert_seeker(
      const domain::Seeker& seeker) = 0;

  [[nodiscard]] virtual std::optional<domain::Provider> get_provider(
      const core::ProviderId& id) const = 0;
  [[nodiscard]] virtual std::optional<domain::Seeker> get_seeker(
      const core::SeekerId& id) const = 0;

  [[nodiscard]] virtual std::vector<domain::Provider> list_providers() const = 0;
  [[nodiscard]] virtual std::vector<domain::Seeker> list_seekers() const = 0;
};

// IConnectionRepository stores at most one connection per (provider, seeker).
class IConnectionRepository {
 public:
  virtual ~IConnectionRepository() = default;

  // kConflict if the pair already has a connection.
  [[nodiscard]] virtual core::Result<bool, core::StorageError> insert(
      const domain::Connection& connection) = 0;

  // kNotFound if the pair has no connection.
  [[nodiscard]] virtual core::Result<bool, core::StorageError> update(
      const domain::Connection& connection) = 0;

  // Reads report kUnavailable when the store cannot be queried; an empty
  // result always means there is nothing recorded.
  [[nodiscard]] virtual core::Result<std::optional<domain::Connection>, core::StorageError> get(
      const core::ProviderId& provider_id, const core::SeekerId& seeker_id) const = 0;

  // Ordered by seeker id.
  [[nodiscard]] virtual core::Result<std::vector<domain::Connection>, core::StorageError>
  list_for_provider(const core::ProviderId& provider_id) const = 0;

  // Ordered by provider id.
  [[nodiscard]] virtual core::Result<std::vector<domain::Connection>, core::StorageError>
  list_for_seeker(const core::SeekerId& seeker_id) const = 0;

  // Every seeker with a connection to provider_id, whatever its status.
  [[nodiscard]] virtual core::Result<std::set<core::SeekerId>, core::StorageError>
  contacted_seekers(const core::ProviderId& provider_id) const = 0;
};

}  // namespace beacon::storage
