#include "beacon/domain/factor.h"

namespace beacon::domain {

std::string_view to_string(FactorId factor) {
  switch (factor) {
    case FactorId::kSharedInstitution:
      return "shared_institution";
    case FactorId::kInstitutionTier:
      return "institution_tier";
    case FactorId::kIndustryAlignment:
      return "industry_alignment";
    case FactorId::kHelpTypeMatch:
      return "help_type_match";
    case FactorId::kLocationProximity:
      return "location_proximity";
    case FactorId::kExperienceGap:
      return "experience_gap";
    case FactorId::kGpa:
      return "gpa";
    case FactorId::kGoalAlignment:
      return "goal_alignment";
  }
  return "unknown";
}

}  // namespace beacon::domain
