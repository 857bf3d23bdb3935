#include "beacon/matching/eligibility.h"

#include <set>

namespace beacon::matching {

std::size_t count_help_overlap(const std::vector<std::string>& offered,
                               const std::vector<std::string>& needed) {
  const std::set<std::string> offered_set(offered.begin(), offered.end());
  const std::set<std::string> needed_set(needed.begin(), needed.end());

  std::size_t overlap = 0;
  for (const auto& tag : needed_set) {
    if (offered_set.contains(tag)) {
      ++overlap;
    }
  }
  return overlap;
}

EligibilityResult check_eligibility(const domain::Provider& provider,
                                    const NormalizedProfile& provider_norm,
                                    const domain::Seeker& seeker,
                                    const NormalizedProfile& seeker_norm) {
  if (count_help_overlap(provider.help_offered, seeker.help_needed) == 0) {
    return EligibilityResult{false, kReasonNoHelpOverlap};
  }

  if (provider_norm.total_experience <= seeker_norm.total_experience) {
    return EligibilityResult{false, kReasonExperienceGap};
  }

  return EligibilityResult{true, std::nullopt};
}

}  // namespace beacon::matching
