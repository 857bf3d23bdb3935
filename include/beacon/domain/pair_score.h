#pragma once

#include "beacon/domain/goal_alignment.h"

#include <optional>
#include <string>

namespace beacon::domain {

// PairScore is the outcome of scoring one provider/seeker pair.
// Scores are in [0, 100] when eligible and exactly 0 when not.
struct PairScore {
  double provider_score{0.0};
  double seeker_score{0.0};
  double bilateral_score{0.0};
  bool eligible{false};
  std::optional<std::string> ineligibility_reason;  // NOLINT(readability-identifier-naming)
};

// GoalPairScore is a PairScore recomputed with goal alignment as an extra factor.
// goal is absent for ineligible pairs; the estimator is never consulted for them.
struct GoalPairScore {
  PairScore score;
  std::optional<GoalAlignment> goal;
};

}  // namespace beacon::domain
