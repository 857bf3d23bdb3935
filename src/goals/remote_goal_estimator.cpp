#include "beacon/goals/remote_goal_estimator.h"

#include "beacon/goals/goal_prompt.h"
#include "beacon/goals/goal_response.h"

#include <thread>

namespace beacon::goals {

RemoteGoalEstimator::RemoteGoalEstimator(IReasoningClient& client,
                                         const matching::ScoringTables& tables,
                                         RetryPolicy policy)
    : client_(client), normalizer_(tables), policy_(policy) {}

core::Result<domain::GoalAlignment, ReasoningError> RemoteGoalEstimator::estimate(
    const domain::Provider& provider, const domain::Seeker& seeker,
    const core::CancellationToken* cancel) {
  using R = core::Result<domain::GoalAlignment, ReasoningError>;

  const std::string prompt = build_goal_prompt(provider, seeker, normalizer_);
  const int max_attempts = policy_.max_attempts < 1 ? 1 : policy_.max_attempts;

  ReasoningError last_error{ReasoningErrorKind::kTransport, "no attempt made", 0};
  for (int attempt = 1; attempt <= max_attempts; ++attempt) {
    if (cancel != nullptr && cancel->is_cancelled()) {
      return R::err(ReasoningError{ReasoningErrorKind::kCancelled, "request cancelled", 0});
    }

    auto reply = client_.complete(prompt);
    if (reply.has_value()) {
      // A malformed reply is not retried: the same prompt tends to yield the same shape.
      auto judgment = parse_goal_response(reply.value());
      if (!judgment.has_value()) {
        return R::err(judgment.error());
      }
      domain::GoalAlignment result;
      result.score = judgment.value().score;
      result.reasoning = judgment.value().reasoning;
      result.source = domain::GoalSource::kRemote;
      return R::ok(std::move(result));
    }

    last_error = reply.error();
    if (!is_retryable(last_error) || attempt == max_attempts) {
      break;
    }
    std::this_thread::sleep_for(policy_.backoff * attempt);
  }

  return R::err(last_error);
}

}  // namespace beacon::goals
