#pragma once

#include "beacon/domain/factor.h"
#include "beacon/domain/pair_score.h"
#include "beacon/domain/profile.h"
#include "beacon/matching/eligibility.h"
#include "beacon/matching/factor_scorer.h"
#include "beacon/matching/normalizer.h"
#include "beacon/matching/presets.h"
#include "beacon/matching/scorer.h"

#include <functional>

namespace beacon::matching {

// PairEvaluation is everything derived for one pair before aggregation.
// factors is empty for ineligible pairs.
struct PairEvaluation {
  NormalizedProfile provider;
  NormalizedProfile seeker;
  EligibilityResult eligibility;
  domain::FactorScoreSet factors;
};

// weighted_score returns round(100 * sum(score * w) / sum(w), 1) over factors
// with w > 0, or 0 when no factor carries weight.
[[nodiscard]] double weighted_score(const domain::FactorScoreSet& factors,
                                    const std::function<double(domain::FactorId)>& weight_of);

// BilateralScorer is a class per C.2: weights and tables are fixed after
// construction, so evaluation is const and safe to call from several threads.
class BilateralScorer {
 public:
  explicit BilateralScorer(const ScoringTables& tables = default_scoring_tables(),
                           ScoreWeights weights = default_score_weights());

  [[nodiscard]] PairEvaluation evaluate(const domain::Provider& provider,
                                        const domain::Seeker& seeker) const;

  // aggregate scores an evaluation from both perspectives and blends them.
  // Ineligible evaluations yield all-zero scores carrying the reason.
  [[nodiscard]] domain::PairScore aggregate(const domain::Provider& provider,
                                            const PairEvaluation& evaluation) const;

  // As above, weighting goal_alignment with goal_weight on both sides instead
  // of the configured weight. A weight <= 0 leaves the factor out.
  [[nodiscard]] domain::PairScore aggregate(const domain::Provider& provider,
                                            const PairEvaluation& evaluation,
                                            double goal_weight) const;

  // score = aggregate(evaluate(...)), without goal alignment.
  [[nodiscard]] domain::PairScore score(const domain::Provider& provider,
                                        const domain::Seeker& seeker) const;

  // with_goal_alignment returns a copy of evaluation with the goal factor merged in.
  [[nodiscard]] static PairEvaluation with_goal_alignment(PairEvaluation evaluation,
                                                          double goal_score);

  [[nodiscard]] const ScoringTables& tables() const { return tables_; }
  [[nodiscard]] const ScoreWeights& weights() const { return weights_; }
  [[nodiscard]] const ProfileNormalizer& normalizer() const { return normalizer_; }

 private:
  const ScoringTables& tables_;
  ScoreWeights weights_;
  ProfileNormalizer normalizer_;
  FactorScorer factor_scorer_;
};

}  // namespace beacon::matching
