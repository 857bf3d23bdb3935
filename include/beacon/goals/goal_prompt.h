#pragma once

#include "beacon/domain/profile.h"
#include "beacon/matching/normalizer.h"

#include <string>

namespace beacon::goals {

// career_path joins the provider's non-degree positions as
// "title at employer" with " → ".
[[nodiscard]] std::string career_path(const domain::Provider& provider,
                                      const matching::ProfileNormalizer& normalizer);

// build_goal_prompt renders the instruction sent to the reasoning service.
// The reply is expected to be a single JSON object {"score": x, "reasoning": "..."}.
[[nodiscard]] std::string build_goal_prompt(const domain::Provider& provider,
                                            const domain::Seeker& seeker,
                                            const matching::ProfileNormalizer& normalizer);

}  // namespace beacon::goals
