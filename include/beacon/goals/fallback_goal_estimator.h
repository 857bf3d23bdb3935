#pragma once

#include "beacon/goals/goal_estimator.h"
#include "beacon/goals/heuristic_goal_estimator.h"

namespace beacon::goals {

// FallbackGoalEstimator tries primary first and substitutes the heuristic on
// any failure, recording the cause. primary may be nullptr when no reasoning
// service is configured. estimate() always returns ok.
class FallbackGoalEstimator final : public IGoalEstimator {
 public:
  explicit FallbackGoalEstimator(IGoalEstimator* primary);

  [[nodiscard]] domain::GoalAlignment judge(const domain::Provider& provider,
                                            const domain::Seeker& seeker,
                                            const core::CancellationToken* cancel);

  [[nodiscard]] core::Result<domain::GoalAlignment, ReasoningError> estimate(
      const domain::Provider& provider, const domain::Seeker& seeker,
      const core::CancellationToken* cancel) override;

 private:
  IGoalEstimator* primary_;
  HeuristicGoalEstimator heuristic_;
};

}  // namespace beacon::goals
