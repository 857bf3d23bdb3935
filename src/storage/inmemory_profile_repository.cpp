#include "beacon/storage/inmemory_profile_repository.h"

namespace beacon::storage {

core::Result<bool, core::StorageError> InMemoryProfileRepository::upsert_provider(
    const domain::Provider& provider) {
  std::lock_guard<std::mutex> lock(mutex_);
  providers_[provider.provider_id] = provider;
  return core::Result<bool, core::StorageError>::ok(true);
}

core::Result<bool, core::StorageError> InMemoryProfileRepository::upsert_seeker(
    const domain::Seeker& seeker) {
  std::lock_guard<std::mutex> lock(mutex_);
  seekers_[seeker.seeker_id] = seeker;
  return core::Result<bool, core::StorageError>::ok(true);
}

std::optional<domain::Provider> InMemoryProfileRepository::get_provider(
    const core::ProviderId& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = providers_.find(id);
  if (it == providers_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<domain::Seeker> InMemoryProfileRepository::get_seeker(
    const core::SeekerId& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = seekers_.find(id);
  if (it == seekers_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Provider> InMemoryProfileRepository::list_providers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<domain::Provider> result;
  result.reserve(providers_.size());
  for (const auto& [_, provider] : providers_) {
    result.push_back(provider);
  }
  return result;
}

std::vector<domain::Seeker> InMemoryProfileRepository::list_seekers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<domain::Seeker> result;
  result.reserve(seekers_.size());
  for (const auto& [_, seeker] : seekers_) {
    result.push_back(seeker);
  }
  return result;
}

}  // namespace beacon::storage
