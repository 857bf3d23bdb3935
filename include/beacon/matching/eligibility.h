#pragma once

#include "beacon/domain/profile.h"
#include "beacon/matching/normalizer.h"

#include <optional>
#include <string>
#include <vector>

namespace beacon::matching {

constexpr const char* kReasonNoHelpOverlap = "no help type overlap";
constexpr const char* kReasonExperienceGap = "insufficient experience gap";

// Ineligibility is an outcome, not an error.
struct EligibilityResult {
  bool eligible{false};
  std::optional<std::string> reason;
};

// count_help_overlap returns |set(offered) ∩ set(needed)|.
[[nodiscard]] std::size_t count_help_overlap(const std::vector<std::string>& offered,
                                             const std::vector<std::string>& needed);

// check_eligibility applies the two hard gates in order:
// help-type overlap must be non-empty, then provider experience must strictly
// exceed seeker experience.
[[nodiscard]] EligibilityResult check_eligibility(const domain::Provider& provider,
                                                  const NormalizedProfile& provider_norm,
                                                  const domain::Seeker& seeker,
                                                  const NormalizedProfile& seeker_norm);

}  // namespace beacon::matching
