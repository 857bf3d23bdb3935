#pragma once

#include "beacon/core/ids.h"
#include "beacon/core/result.h"
#include "beacon/domain/past_position.h"

#include <optional>
#include <string>
#include <vector>

namespace beacon::domain {

// Profile carries the fields providers and seekers share.
// past_positions is kept sorted by PastPosition::order.
struct Profile {
  std::string name;
  std::string current_role;
  std::string current_employer;
  std::string current_industry;
  std::string location;  // "City, Region"
  std::vector<PastPosition> past_positions;
};

// PreferenceAxis enumerates what a provider can rank.
enum class PreferenceAxis {
  kLocation,
  kAlmaMater,
  kGpa,
  kIndustry,
  kHelpType,
  kPathAlignment,
};

// A rank of 1 is most important, 5 least. nullopt means "no preference".
using PreferenceRank = std::optional<int>;

constexpr int kMinPreferenceRank = 1;
constexpr int kMaxPreferenceRank = 5;

struct ProviderPreferences {
  PreferenceRank location;
  PreferenceRank alma_mater;
  PreferenceRank gpa;
  PreferenceRank industry;
  PreferenceRank help_type;
  PreferenceRank path_alignment;

  [[nodiscard]] const PreferenceRank& rank_for(PreferenceAxis axis) const;
};

struct Provider : Profile {
  core::ProviderId provider_id;
  std::vector<std::string> help_offered;
  std::string help_details;
  std::optional<std::string> alma_mater;
  ProviderPreferences preferences;

  // validate checks id presence and preference ranks in [1, 5].
  [[nodiscard]] core::Result<bool, std::string> validate() const;
};

struct Seeker : Profile {
  core::SeekerId seeker_id;
  std::vector<std::string> help_needed;
  std::optional<double> gpa;  // 4.0 scale; weighted values above 4.0 are allowed
  std::string goal;
  std::string context;

  // validate checks id presence and a finite, non-negative GPA.
  [[nodiscard]] core::Result<bool, std::string> validate() const;
};

// sort_positions orders past positions by their order key, keeping input
// order for equal keys.
void sort_positions(std::vector<PastPosition>& positions);

}  // namespace beacon::domain
