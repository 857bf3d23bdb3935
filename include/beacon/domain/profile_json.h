#pragma once

#include "beacon/core/result.h"
#include "beacon/domain/feed_item.h"
#include "beacon/domain/profile.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace beacon::domain {

// JSON mapping for profile datasets.
// Field names follow the dataset export format: past_positions[].company holds
// the organization, preferences values are a rank, "Don't care", 0 or null.

[[nodiscard]] core::Result<Provider, std::string> provider_from_json(const nlohmann::json& j);
[[nodiscard]] core::Result<Seeker, std::string> seeker_from_json(const nlohmann::json& j);

[[nodiscard]] nlohmann::json provider_to_json(const Provider& provider);
[[nodiscard]] nlohmann::json seeker_to_json(const Seeker& seeker);

// Output views used by the CLI.
[[nodiscard]] nlohmann::json to_json(const PairScore& score);
[[nodiscard]] nlohmann::json to_json(const GoalAlignment& goal);
[[nodiscard]] nlohmann::json to_json(const SeekerView& view);
[[nodiscard]] nlohmann::json to_json(const FeedItem& item);
[[nodiscard]] nlohmann::json to_json(const ScoredCandidate& candidate);

// RejectedRecord locates a dataset entry that failed to parse or validate.
struct RejectedRecord {
  std::string file;
  std::size_t index{0};
  std::string reason;
};

[[nodiscard]] std::string describe(const RejectedRecord& rejected);

struct Dataset {
  std::vector<Provider> providers;
  std::vector<Seeker> seekers;
  std::vector<RejectedRecord> rejected;
};

// load_dataset reads a providers file and a seekers file (each a JSON array).
// Records that fail to parse are skipped and listed in Dataset::rejected.
// Returns err(message) only when a file cannot be read as a JSON array.
[[nodiscard]] core::Result<Dataset, std::string> load_dataset(const std::string& providers_path,
                                                              const std::string& seekers_path);

}  // namespace beacon::domain
