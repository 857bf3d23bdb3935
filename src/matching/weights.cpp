#include "beacon/matching/weights.h"

namespace beacon::matching {

double preference_weight(const domain::PreferenceRank& rank) {
  if (!rank.has_value()) {
    return 0.0;
  }
  return static_cast<double>(6 - *rank);
}

std::optional<domain::PreferenceAxis> provider_axis(domain::FactorId factor) {
  using domain::FactorId;
  using domain::PreferenceAxis;

  switch (factor) {
    case FactorId::kSharedInstitution:
    case FactorId::kInstitutionTier:
      return PreferenceAxis::kAlmaMater;
    case FactorId::kIndustryAlignment:
      return PreferenceAxis::kIndustry;
    case FactorId::kHelpTypeMatch:
      return PreferenceAxis::kHelpType;
    case FactorId::kLocationProximity:
      return PreferenceAxis::kLocation;
    case FactorId::kExperienceGap:
      return PreferenceAxis::kPathAlignment;
    case FactorId::kGpa:
      return PreferenceAxis::kGpa;
    case FactorId::kGoalAlignment:
      return std::nullopt;
  }
  return std::nullopt;
}

double provider_weight(domain::FactorId factor, const domain::ProviderPreferences& preferences,
                       double goal_weight) {
  const auto axis = provider_axis(factor);
  if (!axis.has_value()) {
    return goal_weight;
  }
  return preference_weight(preferences.rank_for(*axis));
}

double seeker_weight(domain::FactorId factor, const ScoringTables& tables, double goal_weight) {
  if (factor == domain::FactorId::kGoalAlignment) {
    return goal_weight;
  }
  const auto it = tables.seeker_weights.find(factor);
  return it != tables.seeker_weights.end() ? it->second : 0.0;
}

}  // namespace beacon::matching
