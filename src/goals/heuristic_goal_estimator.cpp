#include "beacon/goals/heuristic_goal_estimator.h"

#include "beacon/matching/eligibility.h"

#include <algorithm>

namespace beacon::goals {

domain::GoalAlignment HeuristicGoalEstimator::judge(const domain::Provider& provider,
                                                    const domain::Seeker& seeker) const {
  double score = 0.0;
  std::string reasoning;
  const auto add_reason = [&reasoning](const std::string& reason) {
    if (!reasoning.empty()) {
      reasoning += "; ";
    }
    reasoning += reason;
  };

  if (!provider.current_industry.empty() &&
      provider.current_industry == seeker.current_industry) {
    score += kSameIndustryBonus;
    add_reason("Same industry");
  }

  const auto overlap = matching::count_help_overlap(provider.help_offered, seeker.help_needed);
  if (overlap > 0) {
    score += std::min(kPerSharedTagBonus * static_cast<double>(overlap), kSharedTagBonusCap);
    add_reason("Can help with " + std::to_string(overlap) + " needed areas");
  }

  if (reasoning.empty()) {
    reasoning = "Limited alignment";
  }

  domain::GoalAlignment result;
  result.score = std::min(1.0, score);
  result.reasoning = reasoning + kHeuristicSuffix;
  result.source = domain::GoalSource::kHeuristic;
  return result;
}

core::Result<domain::GoalAlignment, ReasoningError> HeuristicGoalEstimator::estimate(
    const domain::Provider& provider, const domain::Seeker& seeker,
    const core::CancellationToken* /*cancel*/) {
  return core::Result<domain::GoalAlignment, ReasoningError>::ok(judge(provider, seeker));
}

}  // namespace beacon::goals
