#include "beacon/domain/profile.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace beacon::domain {

const PreferenceRank& ProviderPreferences::rank_for(PreferenceAxis axis) const {
  switch (axis) {
    case PreferenceAxis::kLocation:
      return location;
    case PreferenceAxis::kAlmaMater:
      return alma_mater;
    case PreferenceAxis::kGpa:
      return gpa;
    case PreferenceAxis::kIndustry:
      return industry;
    case PreferenceAxis::kHelpType:
      return help_type;
    case PreferenceAxis::kPathAlignment:
      return path_alignment;
  }
  return location;
}

namespace {

core::Result<bool, std::string> check_rank(const PreferenceRank& rank, const char* field) {
  if (rank.has_value() && (*rank < kMinPreferenceRank || *rank > kMaxPreferenceRank)) {
    return core::Result<bool, std::string>::err(std::string("preference ") + field +
                                                 " must be in [1, 5], got " +
                                                 std::to_string(*rank));
  }
  return core::Result<bool, std::string>::ok(true);
}

}  // namespace

core::Result<bool, std::string> Provider::validate() const {
  if (provider_id.value.empty()) {
    return core::Result<bool, std::string>::err("provider_id must not be empty");
  }

  const std::pair<const PreferenceRank*, const char*> ranks[] = {
      {&preferences.location, "location"},   {&preferences.alma_mater, "alma_mater"},
      {&preferences.gpa, "gpa"},             {&preferences.industry, "industry"},
      {&preferences.help_type, "help_type"}, {&preferences.path_alignment, "path_alignment"},
  };
  for (const auto& [rank, field] : ranks) {
    auto result = check_rank(*rank, field);
    if (!result.has_value()) {
      return result;
    }
  }

  return core::Result<bool, std::string>::ok(true);
}

core::Result<bool, std::string> Seeker::validate() const {
  if (seeker_id.value.empty()) {
    return core::Result<bool, std::string>::err("seeker_id must not be empty");
  }

  if (gpa.has_value() && !(std::isfinite(*gpa) && *gpa >= 0.0)) {
    return core::Result<bool, std::string>::err("gpa must be a non-negative number, got " +
                                                std::to_string(*gpa));
  }

  return core::Result<bool, std::string>::ok(true);
}

void sort_positions(std::vector<PastPosition>& positions) {
  std::stable_sort(positions.begin(), positions.end(),
                   [](const PastPosition& a, const PastPosition& b) { return a.order < b.order; });
}

}  // namespace beacon::domain
