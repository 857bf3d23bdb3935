#include "beacon/goals/fallback_goal_estimator.h"

namespace beacon::goals {

FallbackGoalEstimator::FallbackGoalEstimator(IGoalEstimator* primary) : primary_(primary) {}

domain::GoalAlignment FallbackGoalEstimator::judge(const domain::Provider& provider,
                                                   const domain::Seeker& seeker,
                                                   const core::CancellationToken* cancel) {
  ReasoningError cause{ReasoningErrorKind::kNotConfigured, "no reasoning service configured", 0};

  if (primary_ != nullptr) {
    auto remote = primary_->estimate(provider, seeker, cancel);
    if (remote.has_value()) {
      return remote.value();
    }
    cause = remote.error();
  }

  domain::GoalAlignment fallback = heuristic_.judge(provider, seeker);
  fallback.fallback_cause = describe(cause);
  return fallback;
}

core::Result<domain::GoalAlignment, ReasoningError> FallbackGoalEstimator::estimate(
    const domain::Provider& provider, const domain::Seeker& seeker,
    const core::CancellationToken* cancel) {
  return core::Result<domain::GoalAlignment, ReasoningError>::ok(judge(provider, seeker, cancel));
}

}  // namespace beacon::goals
