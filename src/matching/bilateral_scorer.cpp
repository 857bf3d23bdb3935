#include "beacon/matching/bilateral_scorer.h"

#include "beacon/core/normalization.h"
#include "beacon/matching/weights.h"

namespace beacon::matching {

double weighted_score(const domain::FactorScoreSet& factors,
                      const std::function<double(domain::FactorId)>& weight_of) {
  double weighted_sum = 0.0;
  double total_weight = 0.0;

  for (const auto& [factor, score] : factors) {
    const double weight = weight_of(factor);
    if (weight > 0.0) {
      weighted_sum += score * weight;
      total_weight += weight;
    }
  }

  if (total_weight <= 0.0) {
    return 0.0;
  }
  return core::round_to(weighted_sum / total_weight * 100.0, 1);
}

BilateralScorer::BilateralScorer(const ScoringTables& tables, ScoreWeights weights)
    : tables_(tables), weights_(weights), normalizer_(tables), factor_scorer_(tables) {}

PairEvaluation BilateralScorer::evaluate(const domain::Provider& provider,
                                         const domain::Seeker& seeker) const {
  PairEvaluation evaluation;
  evaluation.provider = normalizer_.normalize(provider);
  evaluation.seeker = normalizer_.normalize(seeker);
  evaluation.eligibility =
      check_eligibility(provider, evaluation.provider, seeker, evaluation.seeker);

  if (evaluation.eligibility.eligible) {
    evaluation.factors =
        factor_scorer_.score(provider, evaluation.provider, seeker, evaluation.seeker);
  }
  return evaluation;
}

domain::PairScore BilateralScorer::aggregate(const domain::Provider& provider,
                                             const PairEvaluation& evaluation) const {
  return aggregate(provider, evaluation, weights_.goal_weight);
}

domain::PairScore BilateralScorer::aggregate(const domain::Provider& provider,
                                             const PairEvaluation& evaluation,
                                             const double goal_weight) const {
  domain::PairScore result;
  if (!evaluation.eligibility.eligible) {
    result.eligible = false;
    result.ineligibility_reason = evaluation.eligibility.reason;
    return result;
  }

  result.eligible = true;
  result.provider_score = weighted_score(evaluation.factors, [&](domain::FactorId factor) {
    return provider_weight(factor, provider.preferences, goal_weight);
  });
  result.seeker_score = weighted_score(evaluation.factors, [&](domain::FactorId factor) {
    return seeker_weight(factor, tables_, goal_weight);
  });
  result.bilateral_score = core::round_to(
      weights_.provider_share * result.provider_score + weights_.seeker_share * result.seeker_score,
      1);
  return result;
}

domain::PairScore BilateralScorer::score(const domain::Provider& provider,
                                         const domain::Seeker& seeker) const {
  return aggregate(provider, evaluate(provider, seeker));
}

PairEvaluation BilateralScorer::with_goal_alignment(PairEvaluation evaluation, double goal_score) {
  if (evaluation.eligibility.eligible) {
    evaluation.factors[domain::FactorId::kGoalAlignment] = goal_score;
  }
  return evaluation;
}

}  // namespace beacon::matching
