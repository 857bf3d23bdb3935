#pragma once

#include "beacon/domain/factor.h"
#include "beacon/domain/profile.h"
#include "beacon/matching/scorer.h"

#include <optional>

namespace beacon::matching {

// preference_weight maps rank r in [1, 5] to 6 - r; no preference maps to 0.
[[nodiscard]] double preference_weight(const domain::PreferenceRank& rank);

// provider_axis names the preference that weighs a factor from the provider's
// side. Goal alignment has no axis: it uses the fixed goal weight.
[[nodiscard]] std::optional<domain::PreferenceAxis> provider_axis(domain::FactorId factor);

[[nodiscard]] double provider_weight(domain::FactorId factor,
                                     const domain::ProviderPreferences& preferences,
                                     double goal_weight);

[[nodiscard]] double seeker_weight(domain::FactorId factor, const ScoringTables& tables,
                                   double goal_weight);

}  // namespace beacon::matching
