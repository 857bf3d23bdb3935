#include "beacon/matching/factor_scorer.h"

#include "beacon/matching/eligibility.h"

#include <algorithm>
#include <cstdlib>
#include <set>

namespace beacon::matching {

namespace {

constexpr double kGapRampYears = 3.0;
constexpr double kGapPlateauEndYears = 7.0;
constexpr double kGapDecayPerYear = 0.1;
constexpr double kMaxTierDistance = 3.0;
constexpr double kMaxGpa = 4.0;

}  // namespace

double score_experience_gap(double gap_years) {
  if (gap_years <= 0.0) {
    return 0.0;
  }
  if (gap_years < kGapRampYears) {
    return gap_years / kGapRampYears;
  }
  if (gap_years <= kGapPlateauEndYears) {
    return 1.0;
  }
  return 1.0 / (1.0 + kGapDecayPerYear * (gap_years - kGapPlateauEndYears));
}

double score_tier_distance(int provider_tier, int seeker_tier) {
  const double distance = std::abs(provider_tier - seeker_tier);
  return std::max(0.0, 1.0 - distance / kMaxTierDistance);
}

FactorScorer::FactorScorer(const ScoringTables& tables) : tables_(tables) {}

domain::FactorScoreSet FactorScorer::score(const domain::Provider& provider,
                                           const NormalizedProfile& provider_norm,
                                           const domain::Seeker& seeker,
                                           const NormalizedProfile& seeker_norm) const {
  using domain::FactorId;
  domain::FactorScoreSet factors;

  const bool same_institution = provider_norm.alma_mater.has_value() &&
                                seeker_norm.alma_mater.has_value() &&
                                *provider_norm.alma_mater == *seeker_norm.alma_mater;
  factors[FactorId::kSharedInstitution] = same_institution ? 1.0 : 0.0;

  const int provider_tier = provider_norm.alma_mater.has_value()
                                ? tables_.tier_of(*provider_norm.alma_mater)
                                : tables_.default_tier;
  const int seeker_tier = seeker_norm.alma_mater.has_value()
                              ? tables_.tier_of(*seeker_norm.alma_mater)
                              : tables_.default_tier;
  factors[FactorId::kInstitutionTier] = score_tier_distance(provider_tier, seeker_tier);

  const bool same_industry = !provider.current_industry.empty() &&
                             !seeker.current_industry.empty() &&
                             provider.current_industry == seeker.current_industry;
  factors[FactorId::kIndustryAlignment] = same_industry ? 1.0 : 0.0;

  const std::set<std::string> needs(seeker.help_needed.begin(), seeker.help_needed.end());
  if (needs.empty()) {
    factors[FactorId::kHelpTypeMatch] = 0.0;
  } else {
    const auto overlap = count_help_overlap(provider.help_offered, seeker.help_needed);
    factors[FactorId::kHelpTypeMatch] =
        std::min(1.0, static_cast<double>(overlap) / static_cast<double>(needs.size()));
  }

  factors[FactorId::kLocationProximity] =
      compare_locations(provider_norm.location, seeker_norm.location);

  factors[FactorId::kExperienceGap] =
      score_experience_gap(provider_norm.total_experience - seeker_norm.total_experience);

  if (provider.preferences.gpa.has_value()) {
    factors[FactorId::kGpa] = std::clamp(seeker.gpa.value_or(0.0) / kMaxGpa, 0.0, 1.0);
  }

  return factors;
}

}  // namespace beacon::matching
