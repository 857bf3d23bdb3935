#pragma once

#include "beacon/domain/factor.h"
#include "beacon/domain/profile.h"
#include "beacon/matching/normalizer.h"
#include "beacon/matching/scorer.h"

namespace beacon::matching {

// Piecewise experience-gap curve: 0 for gap <= 0, rising linearly to 1 at 3
// years, flat through 7, then 1 / (1 + 0.1 (gap - 7)).
[[nodiscard]] double score_experience_gap(double gap_years);

// 1 - |a - b| / 3, floored at 0.
[[nodiscard]] double score_tier_distance(int provider_tier, int seeker_tier);

// FactorScorer computes the base per-pair factors, each in [0, 1].
// GPA is included only when the provider ranked it.
class FactorScorer {
 public:
  explicit FactorScorer(const ScoringTables& tables);

  [[nodiscard]] domain::FactorScoreSet score(const domain::Provider& provider,
                                             const NormalizedProfile& provider_norm,
                                             const domain::Seeker& seeker,
                                             const NormalizedProfile& seeker_norm) const;

 private:
  const ScoringTables& tables_;
};

}  // namespace beacon::matching
