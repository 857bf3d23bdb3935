#pragma once

#include <map>
#include <string_view>

namespace beacon::domain {

// FactorId is the closed set of per-pair compatibility factors.
// Every switch over it is exhaustive; adding a factor must touch each mapping.
enum class FactorId {
  kSharedInstitution,
  kInstitutionTier,
  kIndustryAlignment,
  kHelpTypeMatch,
  kLocationProximity,
  kExperienceGap,
  kGpa,
  kGoalAlignment,
};

[[nodiscard]] std::string_view to_string(FactorId factor);

// FactorScoreSet holds only the factors actually computed for a pair.
// Values are in [0, 1]. std::map keeps iteration order stable.
using FactorScoreSet = std::map<FactorId, double>;

}  // namespace beacon::domain
