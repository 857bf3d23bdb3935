#pragma once

#include "beacon/domain/factor.h"

#include <map>
#include <string>
#include <vector>

namespace beacon::matching {

// ScoreWeights controls how perspectives are blended into the bilateral score
// and how heavily goal alignment counts when it is computed.
struct ScoreWeights {
  double provider_share{0.6};
  double seeker_share{0.4};
  double goal_weight{5.0};
};

// ScoringTables is the immutable reference data every scorer reads.
// Built once and shared by const reference; it must outlive the scorers using it.
struct ScoringTables {
  // Title prefixes that mark a past position as a degree ("BS", "MBA", ...).
  // Matching is case-sensitive, at the start of the title.
  std::vector<std::string> degree_prefixes;

  // Institution name -> tier (1 best). Exact, case-sensitive names.
  std::map<std::string, int> institution_tiers;
  int default_tier{4};

  // Fixed seeker-perspective weights. Factors absent here weigh 0.
  std::map<domain::FactorId, double> seeker_weights;

  [[nodiscard]] int tier_of(const std::string& institution) const;
};

}  // namespace beacon::matching
