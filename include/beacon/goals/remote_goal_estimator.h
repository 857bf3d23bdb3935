#pragma once

#include "beacon/goals/goal_estimator.h"
#include "beacon/goals/reasoning_client.h"
#include "beacon/matching/normalizer.h"
#include "beacon/matching/scorer.h"

#include <chrono>

namespace beacon::goals {

// RetryPolicy bounds attempts for retryable failures. Attempt n (1-based)
// waits n * backoff before retrying.
struct RetryPolicy {
  int max_attempts{2};                     // NOLINT(readability-identifier-naming)
  std::chrono::milliseconds backoff{200};  // NOLINT(readability-identifier-naming)
};

// RemoteGoalEstimator asks the reasoning service for a judgment.
// Every failure comes back as a typed ReasoningError; nothing is thrown.
class RemoteGoalEstimator final : public IGoalEstimator {
 public:
  RemoteGoalEstimator(IReasoningClient& client, const matching::ScoringTables& tables,
                      RetryPolicy policy = RetryPolicy{});

  [[nodiscard]] core::Result<domain::GoalAlignment, ReasoningError> estimate(
      const domain::Provider& provider, const domain::Seeker& seeker,
      const core::CancellationToken* cancel) override;

 private:
  IReasoningClient& client_;
  matching::ProfileNormalizer normalizer_;
  RetryPolicy policy_;
};

}  // namespace beacon::goals
