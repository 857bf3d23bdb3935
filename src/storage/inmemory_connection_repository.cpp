#include "beacon/storage/inmemory_connection_repository.h"

namespace beacon::storage {

core::Result<bool, core::StorageError> InMemoryConnectionRepository::insert(
    const domain::Connection& connection) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto [_, inserted] =
      connections_.emplace(Key{connection.provider_id, connection.seeker_id}, connection);
  if (!inserted) {
    return core::Result<bool, core::StorageError>::err(core::StorageError::kConflict);
  }
  return core::Result<bool, core::StorageError>::ok(true);
}

core::Result<bool, core::StorageError> InMemoryConnectionRepository::update(
    const domain::Connection& connection) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = connections_.find(Key{connection.provider_id, connection.seeker_id});
  if (it == connections_.end()) {
    return core::Result<bool, core::StorageError>::err(core::StorageError::kNotFound);
  }
  it->second = connection;
  return core::Result<bool, core::StorageError>::ok(true);
}

core::Result<std::optional<domain::Connection>, core::StorageError>
InMemoryConnectionRepository::get(const core::ProviderId& provider_id,
                                  const core::SeekerId& seeker_id) const {
  using R = core::Result<std::optional<domain::Connection>, core::StorageError>;
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = connections_.find(Key{provider_id, seeker_id});
  if (it == connections_.end()) {
    return R::ok(std::nullopt);
  }
  return R::ok(it->second);
}

core::Result<std::vector<domain::Connection>, core::StorageError>
InMemoryConnectionRepository::list_for_provider(const core::ProviderId& provider_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<domain::Connection> result;
  // Keys sort by provider first, so one provider's rows are contiguous.
  for (auto it = connections_.lower_bound(Key{provider_id, core::SeekerId{}});
       it != connections_.end() && it->first.first == provider_id; ++it) {
    result.push_back(it->second);
  }
  return core::Result<std::vector<domain::Connection>, core::StorageError>::ok(std::move(result));
}

core::Result<std::vector<domain::Connection>, core::StorageError>
InMemoryConnectionRepository::list_for_seeker(const core::SeekerId& seeker_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<domain::Connection> result;
  // Full scan; iteration order already puts provider ids in ascending order.
  for (const auto& [key, connection] : connections_) {
    if (key.second == seeker_id) {
      result.push_back(connection);
    }
  }
  return core::Result<std::vector<domain::Connection>, core::StorageError>::ok(std::move(result));
}

core::Result<std::set<core::SeekerId>, core::StorageError>
InMemoryConnectionRepository::contacted_seekers(const core::ProviderId& provider_id) const {
  const auto connections = list_for_provider(provider_id);
  std::set<core::SeekerId> ids;
  for (const auto& connection : connections.value()) {
    ids.insert(connection.seeker_id);
  }
  return core::Result<std::set<core::SeekerId>, core::StorageError>::ok(std::move(ids));
}

}  // namespace beacon::storage
