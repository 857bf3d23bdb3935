#pragma once

#include "beacon/goals/goal_estimator.h"

namespace beacon::goals {

constexpr double kSameIndustryBonus = 0.5;
constexpr double kPerSharedTagBonus = 0.3;
constexpr double kSharedTagBonusCap = 0.4;
constexpr const char* kHeuristicSuffix = " (heuristic fallback)";

// HeuristicGoalEstimator is the deterministic stand-in for the remote judgment:
// +0.5 for the same industry, +min(0.3 * shared tags, 0.4), capped at 1.0.
// It never fails.
class HeuristicGoalEstimator final : public IGoalEstimator {
 public:
  [[nodiscard]] domain::GoalAlignment judge(const domain::Provider& provider,
                                            const domain::Seeker& seeker) const;

  [[nodiscard]] core::Result<domain::GoalAlignment, ReasoningError> estimate(
      const domain::Provider& provider, const domain::Seeker& seeker,
      const core::CancellationToken* cancel) override;
};

}  // namespace beacon::goals
