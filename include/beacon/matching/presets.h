#pragma once

#include "beacon/matching/scorer.h"

namespace beacon::matching {

// default_scoring_tables returns the process-wide tables: the degree prefix
// list, the four-tier institution table and the seeker default weights.
// The returned reference is valid for the lifetime of the program.
[[nodiscard]] const ScoringTables& default_scoring_tables();

inline ScoreWeights default_score_weights() {
  return ScoreWeights{0.6, 0.4, 5.0};
}

}  // namespace beacon::matching
